// ---------------------------------------------------------------------------
// types.cpp
//
// 공용 열거형의 문자열 변환.
// 여기서 정한 이름은 verdict JSON, 감사 스냅샷, YAML 설정이 함께 쓰므로
// 바꾸면 기존 감사 체인 재검증 결과가 달라진다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::string_view to_string(IntentLabel label) noexcept {
    switch (label) {
        case IntentLabel::kChat:      return "chat";
        case IntentLabel::kSummarize: return "summarize";
        case IntentLabel::kTool:      return "tool";
        case IntentLabel::kAdmin:     return "admin";
        case IntentLabel::kUnknown:   return "unknown";
    }
    return "unknown";
}

std::string_view to_string(SanitizeMode mode) noexcept {
    switch (mode) {
        case SanitizeMode::kDetect: return "detect";
        case SanitizeMode::kMask:   return "mask";
        case SanitizeMode::kRedact: return "redact";
    }
    return "detect";
}

std::string_view to_string(PolicyAction action) noexcept {
    switch (action) {
        case PolicyAction::kAllow:             return "allow";
        case PolicyAction::kBlock:             return "block";
        case PolicyAction::kAllowWithSanitize: return "allow_with_sanitize";
    }
    return "block";
}

std::string_view to_string(Decision decision) noexcept {
    return decision == Decision::kAllow ? "allow" : "block";
}

std::string_view to_string(DecisionReason reason) noexcept {
    switch (reason) {
        case DecisionReason::kNone:                return "none";
        case DecisionReason::kInvalidRequest:      return "invalid_request";
        case DecisionReason::kDetectionDegraded:   return "detection_degraded";
        case DecisionReason::kInjection:           return "injection";
        case DecisionReason::kPolicyDenied:        return "policy_denied";
        case DecisionReason::kRiskThreshold:       return "risk_threshold";
        case DecisionReason::kCancelled:           return "cancelled";
        case DecisionReason::kUpstreamTimeout:     return "upstream_timeout";
        case DecisionReason::kUpstreamUnavailable: return "upstream_unavailable";
        case DecisionReason::kResponseSecretLeak:  return "response_secret_leak";
        case DecisionReason::kAuditWriteFailure:   return "audit_write_failure";
        case DecisionReason::kInternalError:       return "internal_error";
        case DecisionReason::kRateLimited:         return "rate_limited";
    }
    return "internal_error";
}

std::string_view to_string(GateErrorCode code) noexcept {
    switch (code) {
        case GateErrorCode::kConfigurationError:  return "configuration_error";
        case GateErrorCode::kDetectionDegraded:   return "detection_degraded";
        case GateErrorCode::kUpstreamUnavailable: return "upstream_unavailable";
        case GateErrorCode::kUpstreamTimeout:     return "upstream_timeout";
        case GateErrorCode::kAuditWriteFailure:   return "audit_write_failure";
        case GateErrorCode::kInvalidRequest:      return "invalid_request";
        case GateErrorCode::kCancelled:           return "cancelled";
        case GateErrorCode::kInternalError:       return "internal_error";
    }
    return "internal_error";
}

std::optional<IntentLabel> parse_intent_label(std::string_view name) {
    const std::string n = to_lower(name);
    if (n == "chat")      { return IntentLabel::kChat; }
    if (n == "summarize") { return IntentLabel::kSummarize; }
    if (n == "tool")      { return IntentLabel::kTool; }
    if (n == "admin")     { return IntentLabel::kAdmin; }
    if (n == "unknown")   { return IntentLabel::kUnknown; }
    return std::nullopt;
}

std::optional<SanitizeMode> parse_sanitize_mode(std::string_view name) {
    const std::string n = to_lower(name);
    if (n == "detect") { return SanitizeMode::kDetect; }
    if (n == "mask")   { return SanitizeMode::kMask; }
    if (n == "redact") { return SanitizeMode::kRedact; }
    return std::nullopt;
}

std::optional<PolicyAction> parse_policy_action(std::string_view name) {
    const std::string n = to_lower(name);
    if (n == "allow")               { return PolicyAction::kAllow; }
    if (n == "block")               { return PolicyAction::kBlock; }
    if (n == "allow_with_sanitize") { return PolicyAction::kAllowWithSanitize; }
    return std::nullopt;
}

DecisionReason reason_for(GateErrorCode code) noexcept {
    switch (code) {
        case GateErrorCode::kDetectionDegraded:   return DecisionReason::kDetectionDegraded;
        case GateErrorCode::kUpstreamUnavailable: return DecisionReason::kUpstreamUnavailable;
        case GateErrorCode::kUpstreamTimeout:     return DecisionReason::kUpstreamTimeout;
        case GateErrorCode::kAuditWriteFailure:   return DecisionReason::kAuditWriteFailure;
        case GateErrorCode::kInvalidRequest:      return DecisionReason::kInvalidRequest;
        case GateErrorCode::kCancelled:           return DecisionReason::kCancelled;
        case GateErrorCode::kConfigurationError:
        case GateErrorCode::kInternalError:       return DecisionReason::kInternalError;
    }
    return DecisionReason::kInternalError;
}
