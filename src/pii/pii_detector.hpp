#pragma once

// ---------------------------------------------------------------------------
// pii_detector.hpp
//
// 정규식 + 체크섬 기반 PII / 비밀값 스팬 탐지기.
// PIISanitizer(프롬프트)와 ResponseGuard(응답)가 같은 인스턴스를 공유한다.
//
// [탐지 순서]
// 규칙 벡터 순서가 곧 우선순위다. 앞선 규칙이 채택한 스팬과 조금이라도
// 겹치는 후보는 버린다. 그래서 비밀값(개인키, JWT, API 키)을 먼저 두고
// 숫자형 PII(카드, 계좌)를 전화번호보다 앞에 둔다. 전화번호 정규식은
// 범위가 넓어서 카드 번호 일부를 먼저 먹어버릴 수 있기 때문이다.
//
// [캡처 그룹 규칙]
// 패턴에 캡처 그룹 1 이 있고 매칭되었으면 그룹 1 만 스팬으로 삼는다.
// "api_key=XXXX" 에서 키 이름은 남기고 값만 가리기 위함이다.
// 그룹이 필요 없는 패턴은 비캡처 그룹 (?:...) 만 사용할 것.
//
// [오탐/미탐 트레이드오프]
// - 카드/SSN/Aadhaar/IBAN/IPv4 는 validators 로 구조를 재검증하여 오탐을 줄인다.
// - 전화번호는 자릿수(10..15)만 검증하므로 긴 주문번호 등에서 오탐 가능.
// - 멀티바이트 문자 경계는 고려하지 않는다 (패턴이 ASCII 만 소비).
//
// [반복 상한]
// 모든 반복에 상한이 있다 (common/regex_bounds.hpp). 상한보다 긴 값은
// 상한까지만 스팬이 되고 나머지는 원문에 남는다. 예를 들어 1024자를 넘는
// 액세스 토큰은 앞 1024자만 가려진다. 상한 안에 END 라인이 없는 개인키
// 블록은 응답 쪽 잘린 개인키 규칙이 헤더만 잡는다.
//
// [스레드 안전성]
// 생성 이후 불변. detect() 는 concurrent 호출 안전.
// ---------------------------------------------------------------------------

#include "pii/pii_types.hpp"
#include "pii/validators.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// PiiRule
//   category      : 탐지 시 부여할 카테고리
//   pattern       : ECMAScript 정규식
//   confidence    : PiiMatch.confidence 로 그대로 전달
//   validator     : 스팬 재검증기
//   case_sensitive: false 면 icase 로 컴파일 (키워드 기반 규칙)
// ---------------------------------------------------------------------------
struct PiiRule {
    PiiCategory   category{PiiCategory::kEmail};
    std::string   pattern{};
    double        confidence{0.0};
    ValidatorKind validator{ValidatorKind::kNone};
    bool          case_sensitive{true};
};

class PiiDetector {
public:
    // 생성자: 규칙을 순서대로 컴파일한다.
    //   잘못된 정규식, 상한 없는 반복이 있는 정규식은 경고 로그 후 건너뛴다
    //   (나머지 규칙은 유지).
    explicit PiiDetector(std::vector<PiiRule> rules);

    ~PiiDetector();

    PiiDetector(const PiiDetector&)            = delete;
    PiiDetector& operator=(const PiiDetector&) = delete;
    PiiDetector(PiiDetector&&) noexcept;
    PiiDetector& operator=(PiiDetector&&) noexcept;

    // default_rules
    //   프롬프트/응답 공통 PII 규칙 (비밀값 → 금융 → 연락처 → 네트워크 순).
    [[nodiscard]] static std::vector<PiiRule> default_rules();

    // default_secret_rules
    //   응답 전용 비밀값 규칙. 공급자별 키 모양과 "비밀번호는 ..." 류 문장.
    //   프롬프트 쪽 인젝션 규칙과는 별개의 테이블이다.
    [[nodiscard]] static std::vector<PiiRule> default_secret_rules();

    // detect
    //   text 에서 겹치지 않는 스팬 목록을 start 오름차순으로 반환한다.
    //   같은 입력에 대해 항상 같은 결과 (결정적).
    //
    //   [예외]
    //   std::regex 가 매우 긴 입력에서 std::regex_error(error_complexity 등)를
    //   던질 수 있다. 호출자(파이프라인 경계)가 처리한다.
    [[nodiscard]] std::vector<PiiMatch> detect(std::string_view text) const;

    [[nodiscard]] std::size_t rule_count() const noexcept;

    // merge
    //   primary 스팬을 우선으로 두고, secondary 중 primary 와 겹치지 않는 스팬만
    //   추가하여 start 순으로 정렬한다.
    [[nodiscard]] static std::vector<PiiMatch> merge(std::vector<PiiMatch>        primary,
                                                     const std::vector<PiiMatch>& secondary);

private:
    struct CompiledRule;
    std::vector<CompiledRule> rules_;
};
