#pragma once

// ---------------------------------------------------------------------------
// security_verdict.hpp
//
// 파이프라인의 최종 출력. 요청마다 하나, 생성 후 불변.
// 감사 로거와 호출자에게 같은 값이 전달된다.
//
// [직렬화 스키마 (version 1, 필드 집합 고정)]
// {"version":1,"request_id","decision","reason","risk_score","risk_band",
//  "intent","policy","policy_rule",
//  "pii":{"detected","count","types","original_length","sanitized_length"},
//  "prompt_check":{"decision","is_injection","confidence","matched_rule_id","degraded"},
//  "response_guard":{"decision"},
//  "response_filtered"}
// 이 문자열이 감사 항목의 verdict_snapshot 이 된다. audited 와
// audit_sequence_no 는 감사 기록 이후에 정해지므로 스냅샷에 포함하지 않는다.
//
// [민감정보]
// 프롬프트/응답 텍스트는 verdict 에 들어가지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>

#include "common/types.hpp"
#include "detector/injection_detector.hpp"
#include "guard/response_guard.hpp"
#include "pii/pii_types.hpp"
#include "risk/risk_scorer.hpp"

struct SecurityVerdict {
    static constexpr int kVersion = 1;

    std::string                  request_id{};
    Decision                     decision{Decision::kBlock};  // fail-close 기본값
    DecisionReason               reason{DecisionReason::kInternalError};
    RiskScore                    risk{};
    InjectionVerdict             injection{};
    IntentLabel                  intent{IntentLabel::kUnknown};
    PolicyAction                 policy{PolicyAction::kBlock};
    std::string                  matched_policy_rule{};
    PiiSummary                   pii{};
    GuardDecision                response_guard{GuardDecision::kSkipped};
    bool                         response_filtered{false};
    bool                         audited{false};
    std::optional<std::uint64_t> audit_sequence_no{};
};

// ---------------------------------------------------------------------------
// GatewayResponse
//   handle() 의 반환값.
//   response_text 는 decision == allow 이고 감사 기록이 성공했을 때만 채워진다.
//   sanitized_prompt 는 모델로 보낸(또는 보낼) 변환된 프롬프트.
// ---------------------------------------------------------------------------
struct GatewayResponse {
    SecurityVerdict            verdict{};
    std::optional<std::string> response_text{};
    std::string                sanitized_prompt{};
};

// unaudited_block
//   감사 기록까지 가지 못한 요청의 응답. 기본 verdict(block, internal_error)에
//   request_id 만 채우고 audited=false, 응답 텍스트 없음.
[[nodiscard]] GatewayResponse unaudited_block(std::string request_id);

// to_json
//   version 1 스키마로 직렬화한다. 같은 verdict 는 항상 같은 문자열.
[[nodiscard]] std::string to_json(const SecurityVerdict& verdict);
