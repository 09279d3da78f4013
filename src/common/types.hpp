#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ModelParams
//   생성 모델 호출 파라미터. intake 단계에서 기본값이 채워진 뒤 불변.
// ---------------------------------------------------------------------------
struct ModelParams {
    std::string   model{};              // 업스트림 모델 이름
    std::uint32_t max_tokens{256};      // 생성 토큰 상한 (역할별 상한으로 추가 제한 가능)
    double        temperature{0.7};     // 샘플링 온도 [0, 2]
};

// ---------------------------------------------------------------------------
// Request
//   intake 가 정규화한 요청 레코드.
//   생성 이후 변경되지 않으며 모든 단계에 const-ref 로 전달된다.
//   role 은 외부 인증 계층에서 이미 확정된 값이다 (여기서 검증하지 않음).
// ---------------------------------------------------------------------------
struct Request {
    std::string   id{};                 // 요청 식별자 (감사 로그 키)
    std::string   prompt_text{};        // 숨김 문자 제거 후 프롬프트
    std::string   role{};               // 호출자 역할 (guest, user, developer, admin ...)
    std::string   caller{};             // 속도 제한 키. 없으면 role
    ModelParams   model_params{};
    std::chrono::system_clock::time_point received_at{};
};

// ---------------------------------------------------------------------------
// IntentLabel
//   의도 분류 결과. 닫힌 열거형.
// ---------------------------------------------------------------------------
enum class IntentLabel : std::uint8_t {
    kChat      = 0,
    kSummarize = 1,
    kTool      = 2,
    kAdmin     = 3,
    kUnknown   = 4,
};

// ---------------------------------------------------------------------------
// SanitizeMode
//   PII 변환 모드. PIISanitizer 와 ResponseGuard 가 같은 값을 공유한다.
//   kDetect : 기록만 하고 텍스트는 그대로
//   kMask   : 부분 가림 (마지막 4자리, 이메일 첫 글자 + 도메인 등)
//   kRedact : 카테고리별 고정 placeholder 로 전체 치환
// ---------------------------------------------------------------------------
enum class SanitizeMode : std::uint8_t {
    kDetect = 0,
    kMask   = 1,
    kRedact = 2,
};

// ---------------------------------------------------------------------------
// PolicyAction
//   정책 판정 액션. 기본값은 항상 kBlock (fail-close).
// ---------------------------------------------------------------------------
enum class PolicyAction : std::uint8_t {
    kAllow             = 0,
    kBlock             = 1,
    kAllowWithSanitize = 2,  // 허용하되 프롬프트 PII 변환을 최소 mask 로 강제
};

// ---------------------------------------------------------------------------
// Decision
//   파이프라인 최종 판정.
// ---------------------------------------------------------------------------
enum class Decision : std::uint8_t {
    kAllow = 0,
    kBlock = 1,
};

// ---------------------------------------------------------------------------
// DecisionReason
//   최종 판정의 사유 코드. 문자열 표현은 verdict JSON / 로그에서 안정적으로 유지한다.
//   차단 사유가 여러 개면 가장 앞 단계의 사유가 남는다.
// ---------------------------------------------------------------------------
enum class DecisionReason : std::uint8_t {
    kNone                = 0,
    kInvalidRequest      = 1,
    kDetectionDegraded   = 2,
    kInjection           = 3,
    kPolicyDenied        = 4,
    kRiskThreshold       = 5,
    kCancelled           = 6,
    kUpstreamTimeout     = 7,
    kUpstreamUnavailable = 8,
    kResponseSecretLeak  = 9,
    kAuditWriteFailure   = 10,
    kInternalError       = 11,
    kRateLimited         = 12,
};

// ---------------------------------------------------------------------------
// GateErrorCode
//   컴포넌트 오류 분류. std::expected<T, GateError> 와 함께 사용한다.
//
//   kConfigurationError : 규칙/설정 로드 실패 (기동 시 치명적)
//   kDetectionDegraded  : 탐지 단계가 평가 불가 (빈 규칙 등)
//   kUpstreamUnavailable: 모델 백엔드 전송/응답 오류
//   kUpstreamTimeout    : 모델 백엔드 타임아웃
//   kAuditWriteFailure  : 감사 체인 기록 실패 (해당 요청에 치명적)
//   kInvalidRequest     : intake 검증 실패
//   kCancelled          : 호출자 취소
//   kInternalError      : 그 밖의 내부 오류
// ---------------------------------------------------------------------------
enum class GateErrorCode : std::uint8_t {
    kConfigurationError  = 0,
    kDetectionDegraded   = 1,
    kUpstreamUnavailable = 2,
    kUpstreamTimeout     = 3,
    kAuditWriteFailure   = 4,
    kInvalidRequest      = 5,
    kCancelled           = 6,
    kInternalError       = 7,
};

// ---------------------------------------------------------------------------
// GateError
//   실패 시 반환되는 오류 정보.
// ---------------------------------------------------------------------------
struct GateError {
    GateErrorCode code{GateErrorCode::kInternalError};
    std::string   message{};  // 사람이 읽을 수 있는 오류 설명
    std::string   context{};  // 오류가 발생한 위치 (로깅용, 사용자 텍스트 금지)
};

// ---------------------------------------------------------------------------
// 문자열 변환
//   JSON / 로그 / YAML 에서 쓰는 고정 이름. 구현은 types.cpp.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string_view to_string(IntentLabel label) noexcept;
[[nodiscard]] std::string_view to_string(SanitizeMode mode) noexcept;
[[nodiscard]] std::string_view to_string(PolicyAction action) noexcept;
[[nodiscard]] std::string_view to_string(Decision decision) noexcept;
[[nodiscard]] std::string_view to_string(DecisionReason reason) noexcept;
[[nodiscard]] std::string_view to_string(GateErrorCode code) noexcept;

[[nodiscard]] std::optional<IntentLabel>  parse_intent_label(std::string_view name);
[[nodiscard]] std::optional<SanitizeMode> parse_sanitize_mode(std::string_view name);
[[nodiscard]] std::optional<PolicyAction> parse_policy_action(std::string_view name);

// reason_for
//   GateError 코드를 verdict 사유 코드로 대응시킨다.
[[nodiscard]] DecisionReason reason_for(GateErrorCode code) noexcept;
