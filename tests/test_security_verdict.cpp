// ---------------------------------------------------------------------------
// test_security_verdict.cpp
//
// SecurityVerdict 직렬화와 공용 JSON / 열거형 헬퍼 테스트.
//
// [테스트 범위]
// - to_json: version 1 스키마 전체 문자열, 결정성
// - 기본 생성 verdict 는 block / internal_error (fail-close)
// - json_escape / find_string_field / find_number_field
// - 열거형 이름 파싱 (대소문자 무시), GateErrorCode → DecisionReason
// ---------------------------------------------------------------------------

#include "common/json_util.hpp"
#include "common/types.hpp"
#include "gateway/security_verdict.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

SecurityVerdict sample_verdict() {
    SecurityVerdict v{};
    v.request_id          = "req-1";
    v.decision            = Decision::kAllow;
    v.reason              = DecisionReason::kNone;
    v.risk                = RiskScore{.value = 25, .band = RiskBand::kLow};
    v.intent              = IntentLabel::kChat;
    v.policy              = PolicyAction::kAllowWithSanitize;
    v.matched_policy_rule = "role_table:user";
    v.pii.detected        = true;
    v.pii.count           = 2;
    v.pii.types           = {PiiCategory::kEmail, PiiCategory::kCreditCard};
    v.pii.original_length  = 63;
    v.pii.sanitized_length = 69;
    v.response_guard      = GuardDecision::kAllow;
    v.audited             = true;
    v.audit_sequence_no   = 5;
    return v;
}

} // namespace

TEST(SecurityVerdict, ToJson_FullSchema) {
    const std::string expected =
        R"({"version":1,"request_id":"req-1","decision":"allow","reason":"none","risk_score":25,)"
        R"("risk_band":"low","intent":"chat","policy":"allow_with_sanitize","policy_rule":"role_table:user",)"
        R"("pii":{"detected":true,"count":2,"types":["email","credit_card"],"original_length":63,"sanitized_length":69},)"
        R"("prompt_check":{"decision":"allow","is_injection":false,"confidence":0.0000,"matched_rule_id":null,"degraded":false},)"
        R"("response_guard":{"decision":"allow"},"response_filtered":false})";
    EXPECT_EQ(to_json(sample_verdict()), expected);
}

TEST(SecurityVerdict, ToJson_ExcludesAuditFields) {
    auto a = sample_verdict();
    auto b = sample_verdict();
    b.audited           = false;
    b.audit_sequence_no = std::nullopt;

    const auto json = to_json(a);
    EXPECT_EQ(json, to_json(b));
    EXPECT_EQ(json.find("audited"), std::string::npos);
}

TEST(SecurityVerdict, ToJson_InjectionBlock) {
    SecurityVerdict v{};
    v.request_id                = "req-\"x\"";
    v.reason                    = DecisionReason::kInjection;
    v.injection.is_injection    = true;
    v.injection.confidence      = 0.95;
    v.injection.matched_rule_id = 1;

    const auto json = to_json(v);
    EXPECT_NE(json.find(R"("request_id":"req-\"x\"")"), std::string::npos) << json;
    EXPECT_NE(json.find(R"("decision":"block","reason":"injection")"), std::string::npos) << json;
    EXPECT_NE(json.find(
                  R"("prompt_check":{"decision":"block","is_injection":true,"confidence":0.9500,"matched_rule_id":1,"degraded":false})"),
              std::string::npos)
        << json;
    EXPECT_NE(json.find(R"("response_guard":{"decision":"skipped"})"), std::string::npos) << json;
}

TEST(SecurityVerdict, Default_FailClosed) {
    const SecurityVerdict v{};
    EXPECT_EQ(v.decision, Decision::kBlock);
    EXPECT_EQ(v.reason, DecisionReason::kInternalError);
    EXPECT_EQ(v.policy, PolicyAction::kBlock);
    EXPECT_FALSE(v.audited);
}

TEST(SecurityVerdict, UnauditedBlock_FailClosedWithRequestId) {
    const GatewayResponse resp = unaudited_block("req-9");
    EXPECT_EQ(resp.verdict.request_id, "req-9");
    EXPECT_EQ(resp.verdict.decision, Decision::kBlock);
    EXPECT_EQ(resp.verdict.reason, DecisionReason::kInternalError);
    EXPECT_FALSE(resp.verdict.audited);
    EXPECT_FALSE(resp.verdict.audit_sequence_no.has_value());
    EXPECT_FALSE(resp.response_text.has_value());
    EXPECT_TRUE(resp.sanitized_prompt.empty());
}

// ---------------------------------------------------------------------------
// json_util
// ---------------------------------------------------------------------------

TEST(JsonUtil, EscapeControlAndQuotes) {
    EXPECT_EQ(json_escape("a\"b\\c\n\t"), R"(a\"b\\c\n\t)");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), R"(\u0001)");
    EXPECT_EQ(json_quote("x"), R"("x")");
}

TEST(JsonUtil, FindStringField_Unescapes) {
    const std::string json = R"({"command": "inspect", "prompt":"line\nnext \"q\" é"})";
    EXPECT_EQ(find_string_field(json, "command").value_or(""), "inspect");
    EXPECT_EQ(find_string_field(json, "prompt").value_or(""), "line\nnext \"q\" \xC3\xA9");
    EXPECT_FALSE(find_string_field(json, "role").has_value());
}

TEST(JsonUtil, FindStringField_NonStringIsNullopt) {
    EXPECT_FALSE(find_string_field(R"({"max_tokens":12})", "max_tokens").has_value());
}

TEST(JsonUtil, FindNumberField) {
    const std::string json = R"({"max_tokens": 128, "temperature":0.25, "role":"user"})";
    EXPECT_DOUBLE_EQ(find_number_field(json, "max_tokens").value_or(-1), 128.0);
    EXPECT_DOUBLE_EQ(find_number_field(json, "temperature").value_or(-1), 0.25);
    EXPECT_FALSE(find_number_field(json, "role").has_value());
    EXPECT_FALSE(find_number_field(json, "missing").has_value());
}

TEST(JsonUtil, KeyInsideValueNotMatched) {
    // 값 안의 이스케이프된 \"role\" 은 키로 보지 않는다
    const std::string json = R"({"prompt":"what is \"role\" here","role":"admin"})";
    EXPECT_EQ(find_string_field(json, "role").value_or(""), "admin");
}

// ---------------------------------------------------------------------------
// 열거형 이름
// ---------------------------------------------------------------------------

TEST(Types, ParseNamesCaseInsensitive) {
    EXPECT_EQ(parse_intent_label("Summarize"), IntentLabel::kSummarize);
    EXPECT_FALSE(parse_intent_label("browse").has_value());
    EXPECT_EQ(parse_sanitize_mode("REDACT"), SanitizeMode::kRedact);
    EXPECT_FALSE(parse_sanitize_mode("scramble").has_value());
    EXPECT_EQ(parse_policy_action("allow_with_sanitize"), PolicyAction::kAllowWithSanitize);
    EXPECT_FALSE(parse_policy_action("deny").has_value());
}

TEST(Types, ReasonForErrorCode) {
    EXPECT_EQ(reason_for(GateErrorCode::kUpstreamTimeout), DecisionReason::kUpstreamTimeout);
    EXPECT_EQ(reason_for(GateErrorCode::kUpstreamUnavailable), DecisionReason::kUpstreamUnavailable);
    EXPECT_EQ(reason_for(GateErrorCode::kCancelled), DecisionReason::kCancelled);
    EXPECT_EQ(reason_for(GateErrorCode::kAuditWriteFailure), DecisionReason::kAuditWriteFailure);
    EXPECT_EQ(reason_for(GateErrorCode::kConfigurationError), DecisionReason::kInternalError);
}

TEST(Types, ReasonNames) {
    EXPECT_EQ(to_string(DecisionReason::kResponseSecretLeak), "response_secret_leak");
    EXPECT_EQ(to_string(DecisionReason::kRiskThreshold), "risk_threshold");
    EXPECT_EQ(to_string(DecisionReason::kRateLimited), "rate_limited");
    EXPECT_EQ(to_string(GateErrorCode::kDetectionDegraded), "detection_degraded");
}
