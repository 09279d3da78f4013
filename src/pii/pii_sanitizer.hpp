#pragma once

// ---------------------------------------------------------------------------
// pii_sanitizer.hpp
//
// 프롬프트 PII 탐지 + 변환.
//
// [모드]
// 모드는 호출마다 인자로 받는다. 전역 pii_mode 는 파이프라인이 런타임 설정에서
// 읽어 넘기므로 규칙 재배포 없이 바꿀 수 있다.
//
// [detect 모드]
// 텍스트는 바꾸지 않지만 스팬/개수/카테고리는 그대로 보고한다.
// 위험 점수와 UI 표시는 이 정보만으로 동작한다.
//
// [빈 입력]
// 비어 있거나 공백뿐인 텍스트는 탐지 없이 그대로 돌려준다.
// ---------------------------------------------------------------------------

#include "pii/pii_detector.hpp"
#include "pii/pii_types.hpp"

#include <memory>
#include <string_view>

class PiiSanitizer {
public:
    // detector 는 nullptr 불가 (std::invalid_argument)
    explicit PiiSanitizer(std::shared_ptr<const PiiDetector> detector);

    ~PiiSanitizer() = default;

    PiiSanitizer(const PiiSanitizer&)            = delete;
    PiiSanitizer& operator=(const PiiSanitizer&) = delete;
    PiiSanitizer(PiiSanitizer&&)                 = default;
    PiiSanitizer& operator=(PiiSanitizer&&)      = default;

    // sanitize
    //   text 를 스캔하여 mode 에 따라 변환한 SanitizedText 를 반환한다.
    [[nodiscard]] SanitizedText sanitize(std::string_view text, SanitizeMode mode) const;

    [[nodiscard]] const PiiDetector& detector() const noexcept { return *detector_; }

private:
    std::shared_ptr<const PiiDetector> detector_;
};
