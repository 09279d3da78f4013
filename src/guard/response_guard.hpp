#pragma once

// ---------------------------------------------------------------------------
// response_guard.hpp
//
// 모델 응답의 PII / 비밀값 유출 필터.
//
// [탐지]
// 1. 응답 전용 비밀값 규칙 (공급자 키 모양, "password is ..." 류 문장)
// 2. 프롬프트와 같은 PII 규칙 (PiiSanitizer 가 쓰는 PiiDetector 인스턴스 공유)
// 비밀값 스팬을 우선으로 두고 겹치지 않는 PII 스팬을 합친다.
//
// [유출 판정]
// 합쳐진 스팬 중 is_secret(category) 인 것이 하나라도 있으면 leaked=true.
// 이때 변환 모드는 설정값과 관계없이 redact 로 올린다 (원문 전달 금지).
// verdict 쪽에서는 decision=block, response_filtered=true 로 이어진다.
//
// [GuardDecision]
//   kAllow   : 스팬 없음, 또는 detect 모드라 텍스트 그대로
//   kSanitize: PII 스팬을 mask/redact 로 변환함 (유출 아님)
//   kBlock   : 비밀값 유출
//   kSkipped : 모델을 호출하지 않아 검사 대상 응답이 없음
// ---------------------------------------------------------------------------

#include "pii/pii_detector.hpp"
#include "pii/pii_types.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

enum class GuardDecision : std::uint8_t {
    kAllow    = 0,
    kSanitize = 1,
    kBlock    = 2,
    kSkipped  = 3,
};

[[nodiscard]] std::string_view to_string(GuardDecision decision) noexcept;

struct GuardResult {
    SanitizedText            text{};
    bool                     leaked{false};
    std::vector<PiiCategory> secret_categories{};  // 유출된 비밀값 카테고리 (중복 없음)
    GuardDecision            decision{GuardDecision::kAllow};
};

class ResponseGuard {
public:
    // pii_detector    : 프롬프트 쪽과 공유하는 PII 탐지기
    // secret_detector : 응답 전용 비밀값 탐지기
    // 둘 다 nullptr 불가 (std::invalid_argument)
    ResponseGuard(std::shared_ptr<const PiiDetector> pii_detector,
                  std::shared_ptr<const PiiDetector> secret_detector);

    ~ResponseGuard() = default;

    ResponseGuard(const ResponseGuard&)            = delete;
    ResponseGuard& operator=(const ResponseGuard&) = delete;
    ResponseGuard(ResponseGuard&&)                 = default;
    ResponseGuard& operator=(ResponseGuard&&)      = default;

    // guard
    //   response_text 를 스캔/변환한다. mode 는 전역 pii_mode.
    [[nodiscard]] GuardResult guard(std::string_view response_text, SanitizeMode mode) const;

private:
    std::shared_ptr<const PiiDetector> pii_detector_;
    std::shared_ptr<const PiiDetector> secret_detector_;
};
