#pragma once

// ---------------------------------------------------------------------------
// policy_engine.hpp
//
// (role, intent, injection verdict) 를 받아 allow / allow_with_sanitize / block
// 판정을 내리는 엔진.
//
// [fail-close 원칙, 절대 위반 금지]
// 1. injection_verdict.is_injection == true → 반드시 kBlock (역할과 무관)
// 2. 정책 일치 없음 → 반드시 kBlock (default-deny 규칙이 항상 마지막에 존재)
// 3. 정책 테이블 없음 (nullptr) → 반드시 kBlock
// 4. PolicyAction::kAllow 는 명시적 허용 규칙이 존재할 때만 반환
//
// ❌ 금지: 인젝션 판정 → 역할 규칙으로 허용 (injection 이 항상 우선)
// ❌ 금지: 정책 불확실 → kAllow (default whitelist)
//
// [규칙 해석 순서]
// role_table 의 (role, intent) 쌍은 priority 10 의 allow 규칙으로 확장되고,
// policy_rules 와 합쳐진 뒤 default-deny (*, *, block, 최저 priority) 가
// 덧붙는다. 일치 규칙 중 priority 가 가장 큰 규칙이 이기며, 동률이면
//   1) 정확 일치(와일드카드 적은 쪽)
//   2) 더 제한적인 action (block > allow_with_sanitize > allow)
// 순으로 고른다. 따라서 모든 (role, intent) 쌍은 정확히 하나의 action 으로
// 결정된다.
//
// [스레드 안전성]
// 규칙 테이블은 생성 시 한 번 컴파일되고 이후 바뀌지 않는다.
// decide() 는 잠금 없이 동시 호출 안전. 재로드 대상이 아니다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "detector/injection_detector.hpp"  // InjectionVerdict
#include "rule.hpp"                         // PolicyTable, PolicyRule

// ---------------------------------------------------------------------------
// PolicyResult
//   matched_rule: 어떤 규칙에 의해 판정됐는지 (감사 로그용).
//                 "injection-override" | "default-deny" | "no-config" | 규칙 id
//   reason: 사람이 읽을 수 있는 판정 이유 (로깅용).
//           클라이언트에 그대로 노출하지 말 것.
// ---------------------------------------------------------------------------
struct PolicyResult {
    PolicyAction action{PolicyAction::kBlock};  // 기본값 kBlock (fail-close)
    std::string  matched_rule{};
    std::string  reason{};
};

class PolicyEngine {
public:
    static constexpr std::int32_t kRoleTablePriority = 10;
    static constexpr const char*  kDefaultDenyId     = "default-deny";

    // table 이 nullptr 이면 모든 decide() 가 kBlock 을 반환한다 (fail-close).
    explicit PolicyEngine(std::shared_ptr<const PolicyTable> table);

    ~PolicyEngine() = default;

    PolicyEngine(const PolicyEngine&)            = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;

    // decide
    //   순수 함수: 세 입력과 현재 규칙 테이블에만 의존한다.
    [[nodiscard]] PolicyResult decide(std::string_view        role,
                                      IntentLabel             intent,
                                      const InjectionVerdict& injection) const;

    // max_tokens_for
    //   role_max_tokens 에 설정된 역할별 상한. 없으면 nullopt.
    [[nodiscard]] std::optional<std::uint32_t> max_tokens_for(std::string_view role) const;

    // expand
    //   role_table + policy_rules + default-deny 를 하나의 규칙 목록으로 펼친다.
    [[nodiscard]] static std::vector<PolicyRule> expand(const PolicyTable& table);

    // find_conflict
    //   role, intent, priority 가 같고 action 이 다른 규칙 쌍이 있으면
    //   설명 문자열을 반환한다 (설정 오류). 없으면 nullopt.
    [[nodiscard]] static std::optional<std::string> find_conflict(
        const std::vector<PolicyRule>& rules);

    [[nodiscard]] std::size_t rule_count() const;

private:
    struct CompiledPolicy {
        std::vector<PolicyRule>              rules;
        std::map<std::string, std::uint32_t> max_tokens;  // 키는 소문자
    };

    [[nodiscard]] static std::shared_ptr<const CompiledPolicy> compile(
        const std::shared_ptr<const PolicyTable>& table);

    const std::shared_ptr<const CompiledPolicy> compiled_;
};
