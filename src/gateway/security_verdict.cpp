#include "gateway/security_verdict.hpp"

#include <utility>

#include <fmt/format.h>

#include "common/json_util.hpp"

GatewayResponse unaudited_block(std::string request_id) {
    GatewayResponse response{};
    response.verdict.request_id = std::move(request_id);
    return response;
}

std::string to_json(const SecurityVerdict& v) {
    std::string types = "[";
    for (std::size_t i = 0; i < v.pii.types.size(); ++i) {
        if (i > 0) {
            types += ',';
        }
        types += json_quote(to_string(v.pii.types[i]));
    }
    types += ']';

    const std::string matched_rule_id =
        v.injection.matched_rule_id ? fmt::format("{}", *v.injection.matched_rule_id) : "null";

    return fmt::format(
        R"({{"version":{},"request_id":{},"decision":"{}","reason":"{}","risk_score":{},"risk_band":"{}",)"
        R"("intent":"{}","policy":"{}","policy_rule":{},)"
        R"("pii":{{"detected":{},"count":{},"types":{},"original_length":{},"sanitized_length":{}}},)"
        R"("prompt_check":{{"decision":"{}","is_injection":{},"confidence":{:.4f},"matched_rule_id":{},"degraded":{}}},)"
        R"("response_guard":{{"decision":"{}"}},"response_filtered":{}}})",
        SecurityVerdict::kVersion,
        json_quote(v.request_id),
        to_string(v.decision),
        to_string(v.reason),
        v.risk.value,
        to_string(v.risk.band),
        to_string(v.intent),
        to_string(v.policy),
        json_quote(v.matched_policy_rule),
        v.pii.detected,
        v.pii.count,
        types,
        v.pii.original_length,
        v.pii.sanitized_length,
        (v.injection.is_injection || v.injection.degraded) ? "block" : "allow",
        v.injection.is_injection,
        v.injection.confidence,
        matched_rule_id,
        v.injection.degraded,
        to_string(v.response_guard),
        v.response_filtered
    );
}
