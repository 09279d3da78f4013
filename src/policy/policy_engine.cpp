// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// (role, intent, injection verdict) → PolicyAction 판정 엔진.
//
// [Fail-close 원칙, 절대 위반 금지]
// 1. compiled_ == nullptr → kBlock ("no-config")
// 2. is_injection == true → kBlock ("injection-override")
// 3. 정책 일치 없음 → kBlock (default-deny)
// 4. kAllow 는 명시적 허용 규칙이 존재할 때만 반환
//
// [오탐/미탐 트레이드오프]
// - role = "*" 와일드카드 규칙은 모든 역할에 적용되므로 priority 설정 오류 시
//   의도치 않은 허용/차단 발생 가능. 동일 priority 충돌은 로더가 거부한다.
// - 역할 비교는 대소문자 무시. "Admin" 과 "admin" 은 같은 역할이다.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 문자열 대소문자 무관 비교
// ---------------------------------------------------------------------------
bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_wildcard(std::string_view s) noexcept {
    return s == "*";
}

bool matches(const PolicyRule& rule, std::string_view role, std::string_view intent) {
    const bool role_ok   = is_wildcard(rule.role) || iequals(rule.role, role);
    const bool intent_ok = is_wildcard(rule.intent) || iequals(rule.intent, intent);
    return role_ok && intent_ok;
}

// 와일드카드가 적을수록 구체적
int specificity(const PolicyRule& rule) noexcept {
    return (is_wildcard(rule.role) ? 0 : 1) + (is_wildcard(rule.intent) ? 0 : 1);
}

// block > allow_with_sanitize > allow
int restrictiveness(PolicyAction action) noexcept {
    switch (action) {
        case PolicyAction::kAllow:             return 0;
        case PolicyAction::kAllowWithSanitize: return 1;
        case PolicyAction::kBlock:             return 2;
    }
    return 2;
}

// a 가 b 보다 우선하면 true
bool outranks(const PolicyRule& a, const PolicyRule& b) noexcept {
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    if (specificity(a) != specificity(b)) {
        return specificity(a) > specificity(b);
    }
    return restrictiveness(a.action) > restrictiveness(b.action);
}

}  // namespace

PolicyEngine::PolicyEngine(std::shared_ptr<const PolicyTable> table)
    : compiled_{compile(table)}
{
    if (!table) {
        spdlog::warn("policy_engine: constructed without policy table; "
                     "all requests will be blocked (fail-close)");
    }
}

std::vector<PolicyRule> PolicyEngine::expand(const PolicyTable& table) {
    std::vector<PolicyRule> rules;

    for (const auto& [role, intents] : table.role_table) {
        for (const auto intent : intents) {
            const auto intent_name = std::string(to_string(intent));
            rules.push_back(PolicyRule{
                .id       = fmt::format("role_table:{}:{}", role, intent_name),
                .role     = role,
                .intent   = intent_name,
                .action   = PolicyAction::kAllow,
                .priority = kRoleTablePriority,
            });
        }
    }

    rules.insert(rules.end(), table.rules.begin(), table.rules.end());

    rules.push_back(PolicyRule{
        .id       = kDefaultDenyId,
        .role     = "*",
        .intent   = "*",
        .action   = PolicyAction::kBlock,
        .priority = std::numeric_limits<std::int32_t>::min(),
    });
    return rules;
}

std::optional<std::string> PolicyEngine::find_conflict(const std::vector<PolicyRule>& rules) {
    for (std::size_t i = 0; i < rules.size(); ++i) {
        for (std::size_t j = i + 1; j < rules.size(); ++j) {
            const auto& a = rules[i];
            const auto& b = rules[j];
            if (a.priority == b.priority && iequals(a.role, b.role) &&
                iequals(a.intent, b.intent) && a.action != b.action) {
                return fmt::format(
                    "conflicting policy rules '{}' and '{}' for role='{}' intent='{}' priority={}",
                    a.id, b.id, a.role, a.intent, a.priority);
            }
        }
    }
    return std::nullopt;
}

std::shared_ptr<const PolicyEngine::CompiledPolicy> PolicyEngine::compile(
    const std::shared_ptr<const PolicyTable>& table) {
    if (!table) {
        return nullptr;
    }
    auto compiled   = std::make_shared<CompiledPolicy>();
    compiled->rules = expand(*table);
    for (const auto& [role, limit] : table->role_max_tokens) {
        compiled->max_tokens[to_lower(role)] = limit;
    }
    return compiled;
}

PolicyResult PolicyEngine::decide(std::string_view        role,
                                  IntentLabel             intent,
                                  const InjectionVerdict& injection) const {
    // Step 1: 인젝션은 역할 규칙보다 항상 우선
    if (injection.is_injection) {
        return PolicyResult{
            PolicyAction::kBlock,
            "injection-override",
            fmt::format("Prompt injection detected (confidence {:.2f})", injection.confidence)
        };
    }

    // Step 2: 테이블 없음 → fail-close
    const auto& compiled = compiled_;
    if (!compiled) {
        return PolicyResult{PolicyAction::kBlock, "no-config", "Policy table not loaded"};
    }

    // Step 3: 일치 규칙 중 최우선 규칙 선택
    const std::string_view intent_name = to_string(intent);
    const PolicyRule*      best        = nullptr;
    for (const auto& rule : compiled->rules) {
        if (!matches(rule, role, intent_name)) {
            continue;
        }
        if (best == nullptr || outranks(rule, *best)) {
            best = &rule;
        }
    }

    // default-deny 가 항상 존재하므로 best 는 null 이 아니어야 한다.
    if (best == nullptr) {
        spdlog::error("policy_engine: no rule matched role='{}' intent='{}', blocking",
                      role, intent_name);
        return PolicyResult{PolicyAction::kBlock, kDefaultDenyId, "No matching rule"};
    }

    if (best->id == kDefaultDenyId) {
        spdlog::debug("policy_engine: default-deny for role='{}' intent='{}'", role, intent_name);
        return PolicyResult{
            PolicyAction::kBlock,
            best->id,
            fmt::format("Intent '{}' not permitted for role '{}'", intent_name, role)
        };
    }

    return PolicyResult{
        best->action,
        best->id,
        fmt::format("Rule '{}' matched ({})", best->id, to_string(best->action))
    };
}

std::optional<std::uint32_t> PolicyEngine::max_tokens_for(std::string_view role) const {
    if (!compiled_) {
        return std::nullopt;
    }
    const auto it = compiled_->max_tokens.find(to_lower(role));
    if (it == compiled_->max_tokens.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t PolicyEngine::rule_count() const {
    return compiled_ ? compiled_->rules.size() : 0;
}
