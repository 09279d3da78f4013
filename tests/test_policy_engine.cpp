// ---------------------------------------------------------------------------
// test_policy_engine.cpp
//
// PolicyEngine / PolicyLoader 단위 테스트.
//
// [테스트 범위]
// - PolicyEngine: role_table 허용, default-deny, injection-override,
//   nullptr 테이블(no-config), 와일드카드, priority/구체성/제한성 순위,
//   역할 대소문자 무시, max_tokens_for, rule_count, find_conflict
// - PolicyLoader: 존재하지 않는 파일, 유효 YAML, 잘못된 pii_mode/action/intent,
//   범위 밖 수치, 충돌 규칙, 빈 injection.rules, 상한 없는 반복 규칙, rate_limit 섹션,
//   config/gateway.yaml 실제 로딩
//
// [fail-close 검증]
// injection 판정은 어떤 역할 규칙보다 우선하며, 테이블이 없으면 모두 차단.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"
#include "policy/policy_loader.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

InjectionVerdict clean() {
    return InjectionVerdict{};
}

InjectionVerdict injected(double confidence) {
    return InjectionVerdict{.is_injection = true, .confidence = confidence, .matched_rule_id = 1u};
}

std::shared_ptr<const PolicyTable> make_table() {
    auto table = std::make_shared<PolicyTable>();
    table->role_table = {
        {"guest", {IntentLabel::kChat}},
        {"user",  {IntentLabel::kChat, IntentLabel::kSummarize}},
        {"admin", {IntentLabel::kChat, IntentLabel::kSummarize,
                   IntentLabel::kTool, IntentLabel::kAdmin}},
    };
    table->role_max_tokens = {{"guest", 256}, {"User", 1024}};
    return table;
}

// 임시 YAML 파일 (테스트마다 고유 경로, 소멸 시 삭제)
class TempYaml {
public:
    explicit TempYaml(const char* content) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::path("/tmp") /
                ("test_gateway_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter.fetch_add(1)) + ".yaml");
        std::FILE* f = std::fopen(path_.c_str(), "w");
        if (f != nullptr) {
            std::fputs(content, f);
            std::fclose(f);
        }
    }
    ~TempYaml() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempYaml(const TempYaml&)            = delete;
    TempYaml& operator=(const TempYaml&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

// ===========================================================================
// 1. PolicyEngine: 기본 판정
// ===========================================================================

TEST(PolicyEngine, RoleTable_AllowsListedIntent) {
    const PolicyEngine engine(make_table());
    const auto result = engine.decide("user", IntentLabel::kChat, clean());

    EXPECT_EQ(result.action, PolicyAction::kAllow);
    EXPECT_EQ(result.matched_rule, "role_table:user:chat");
}

TEST(PolicyEngine, RoleTable_UnlistedIntentHitsDefaultDeny) {
    const PolicyEngine engine(make_table());
    const auto result = engine.decide("guest", IntentLabel::kAdmin, clean());

    EXPECT_EQ(result.action, PolicyAction::kBlock);
    EXPECT_EQ(result.matched_rule, "default-deny");
    EXPECT_EQ(result.reason, "Intent 'admin' not permitted for role 'guest'");
}

TEST(PolicyEngine, UnknownRole_DefaultDeny) {
    const PolicyEngine engine(make_table());
    const auto result = engine.decide("intruder", IntentLabel::kChat, clean());

    EXPECT_EQ(result.action, PolicyAction::kBlock);
    EXPECT_EQ(result.matched_rule, "default-deny");
}

TEST(PolicyEngine, UnknownIntent_NotAllowedByRoleTable) {
    const PolicyEngine engine(make_table());
    const auto result = engine.decide("admin", IntentLabel::kUnknown, clean());
    EXPECT_EQ(result.action, PolicyAction::kBlock);
}

TEST(PolicyEngine, RoleComparison_CaseInsensitive) {
    const PolicyEngine engine(make_table());
    EXPECT_EQ(engine.decide("USER", IntentLabel::kSummarize, clean()).action,
              PolicyAction::kAllow);
}

// ===========================================================================
// 2. PolicyEngine: fail-close
// ===========================================================================

TEST(PolicyEngine, Injection_OverridesAdminAllow) {
    const PolicyEngine engine(make_table());
    const auto result = engine.decide("admin", IntentLabel::kChat, injected(0.95));

    EXPECT_EQ(result.action, PolicyAction::kBlock);
    EXPECT_EQ(result.matched_rule, "injection-override");
    EXPECT_EQ(result.reason, "Prompt injection detected (confidence 0.95)");
}

TEST(PolicyEngine, NullptrTable_BlocksAll) {
    const PolicyEngine engine(nullptr);
    const auto result = engine.decide("admin", IntentLabel::kChat, clean());

    EXPECT_EQ(result.action, PolicyAction::kBlock);
    EXPECT_EQ(result.matched_rule, "no-config");
    EXPECT_EQ(engine.rule_count(), 0u);
}

TEST(PolicyEngine, NullptrTable_InjectionStillReported) {
    const PolicyEngine engine(nullptr);
    EXPECT_EQ(engine.decide("guest", IntentLabel::kChat, injected(0.7)).matched_rule,
              "injection-override");
}

// ===========================================================================
// 3. PolicyEngine: 규칙 순위
// ===========================================================================

TEST(PolicyEngine, HigherPriorityRule_OverridesRoleTable) {
    auto table = std::make_shared<PolicyTable>(*make_table());
    table->rules.push_back(PolicyRule{
        .id = "guest-chat-sanitized", .role = "guest", .intent = "chat",
        .action = PolicyAction::kAllowWithSanitize, .priority = 20});
    const PolicyEngine engine(table);

    const auto result = engine.decide("guest", IntentLabel::kChat, clean());
    EXPECT_EQ(result.action, PolicyAction::kAllowWithSanitize);
    EXPECT_EQ(result.matched_rule, "guest-chat-sanitized");
}

TEST(PolicyEngine, WildcardRule_AppliesToEveryRole) {
    auto table = std::make_shared<PolicyTable>(*make_table());
    table->rules.push_back(PolicyRule{
        .id = "no-tools", .role = "*", .intent = "tool",
        .action = PolicyAction::kBlock, .priority = 50});
    const PolicyEngine engine(table);

    const auto result = engine.decide("admin", IntentLabel::kTool, clean());
    EXPECT_EQ(result.action, PolicyAction::kBlock);
    EXPECT_EQ(result.matched_rule, "no-tools");
    EXPECT_EQ(engine.decide("admin", IntentLabel::kChat, clean()).action, PolicyAction::kAllow);
}

TEST(PolicyEngine, SamePriority_ExactMatchBeatsWildcard) {
    auto table = std::make_shared<PolicyTable>();
    table->rules = {
        PolicyRule{.id = "any-role-chat", .role = "*", .intent = "chat",
                   .action = PolicyAction::kBlock, .priority = 5},
        PolicyRule{.id = "user-chat", .role = "user", .intent = "chat",
                   .action = PolicyAction::kAllow, .priority = 5},
    };
    const PolicyEngine engine(table);

    EXPECT_EQ(engine.decide("user", IntentLabel::kChat, clean()).matched_rule, "user-chat");
    EXPECT_EQ(engine.decide("guest", IntentLabel::kChat, clean()).matched_rule, "any-role-chat");
}

TEST(PolicyEngine, SamePrioritySameSpecificity_MoreRestrictiveWins) {
    auto table = std::make_shared<PolicyTable>();
    table->rules = {
        PolicyRule{.id = "user-any", .role = "user", .intent = "*",
                   .action = PolicyAction::kAllow, .priority = 5},
        PolicyRule{.id = "any-summarize", .role = "*", .intent = "summarize",
                   .action = PolicyAction::kAllowWithSanitize, .priority = 5},
    };
    const PolicyEngine engine(table);

    const auto result = engine.decide("user", IntentLabel::kSummarize, clean());
    EXPECT_EQ(result.action, PolicyAction::kAllowWithSanitize);
    EXPECT_EQ(result.matched_rule, "any-summarize");
}

TEST(PolicyEngine, Expand_RoleTablePlusDefaultDeny) {
    const auto rules = PolicyEngine::expand(*make_table());
    // admin 4 + guest 1 + user 2 + default-deny
    ASSERT_EQ(rules.size(), 8u);
    EXPECT_EQ(rules.back().id, "default-deny");
    EXPECT_EQ(rules.back().priority, std::numeric_limits<std::int32_t>::min());
    EXPECT_EQ(rules.front().priority, PolicyEngine::kRoleTablePriority);
}

// ===========================================================================
// 4. PolicyEngine: max_tokens_for / rule_count / find_conflict
// ===========================================================================

TEST(PolicyEngine, MaxTokensFor_CaseInsensitive) {
    const PolicyEngine engine(make_table());
    EXPECT_EQ(engine.max_tokens_for("guest").value_or(0), 256u);
    EXPECT_EQ(engine.max_tokens_for("user").value_or(0), 1024u);
    EXPECT_EQ(engine.max_tokens_for("GUEST").value_or(0), 256u);
    EXPECT_FALSE(engine.max_tokens_for("admin").has_value());
}

TEST(PolicyEngine, RuleCount_RoleTablePlusDefaultDeny) {
    auto table = std::make_shared<PolicyTable>();
    table->role_table = {{"guest", {IntentLabel::kChat, IntentLabel::kSummarize}}};
    const PolicyEngine engine(table);

    EXPECT_EQ(engine.rule_count(), 3u);
    EXPECT_EQ(engine.decide("guest", IntentLabel::kSummarize, clean()).action,
              PolicyAction::kAllow);
}

TEST(PolicyEngine, FindConflict_DetectsSameKeyDifferentAction) {
    const std::vector<PolicyRule> rules = {
        PolicyRule{.id = "a", .role = "guest", .intent = "tool",
                   .action = PolicyAction::kAllow, .priority = 30},
        PolicyRule{.id = "b", .role = "GUEST", .intent = "tool",
                   .action = PolicyAction::kBlock, .priority = 30},
    };
    const auto conflict = PolicyEngine::find_conflict(rules);
    ASSERT_TRUE(conflict.has_value());
    EXPECT_NE(conflict->find("'a'"), std::string::npos);
    EXPECT_NE(conflict->find("'b'"), std::string::npos);
}

TEST(PolicyEngine, FindConflict_DifferentPriorityOrSameActionIsFine) {
    const std::vector<PolicyRule> rules = {
        PolicyRule{.id = "a", .role = "guest", .intent = "tool",
                   .action = PolicyAction::kAllow, .priority = 30},
        PolicyRule{.id = "b", .role = "guest", .intent = "tool",
                   .action = PolicyAction::kBlock, .priority = 31},
        PolicyRule{.id = "c", .role = "guest", .intent = "tool",
                   .action = PolicyAction::kAllow, .priority = 30},
    };
    EXPECT_FALSE(PolicyEngine::find_conflict(rules).has_value());
}

// ===========================================================================
// 5. PolicyLoader
// ===========================================================================

TEST(PolicyLoader, LoadNonExistentFile_ReturnsError) {
    const auto result = PolicyLoader::load("/nonexistent/path/gateway.yaml");
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(result.error().empty());
}

TEST(PolicyLoader, LoadValidFile_Succeeds) {
    const TempYaml yaml(R"(
global:
  log_level: debug
  audit_path: ""
  worker_threads: 2
sanitizer:
  pii_mode: redact
risk:
  risk_threshold_block: 60
upstream:
  host: llm.internal
  port: 9000
  model: tiny
  timeout_ms: 2500
  max_attempts: 3
role_table:
  guest: [chat]
  user: [chat, summarize]
policy_rules:
  - id: guest-summarize
    role: guest
    intent: summarize
    action: allow_with_sanitize
    priority: 20
role_max_tokens:
  guest: 128
)");

    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_TRUE(result.has_value()) << "Expected success but got error: " << result.error();

    const auto& cfg = *result;
    EXPECT_EQ(cfg.global.log_level, "debug");
    EXPECT_TRUE(cfg.global.audit_path.empty());
    EXPECT_EQ(cfg.global.worker_threads, 2u);
    EXPECT_EQ(cfg.sanitizer.pii_mode, SanitizeMode::kRedact);
    EXPECT_EQ(cfg.risk.risk_threshold_block, 60u);
    EXPECT_EQ(cfg.upstream.host, "llm.internal");
    EXPECT_EQ(cfg.upstream.port, 9000);
    EXPECT_EQ(cfg.upstream.model, "tiny");
    EXPECT_EQ(cfg.upstream.timeout_ms, 2500u);
    EXPECT_EQ(cfg.upstream.max_attempts, 3u);
    EXPECT_EQ(cfg.policy.role_table.size(), 2u);
    ASSERT_EQ(cfg.policy.rules.size(), 1u);
    EXPECT_EQ(cfg.policy.rules[0].action, PolicyAction::kAllowWithSanitize);
    EXPECT_EQ(cfg.policy.role_max_tokens.at("guest"), 128u);
    EXPECT_FALSE(cfg.injection.rules_configured);
    EXPECT_FALSE(cfg.intents.vocabularies_configured);
}

TEST(PolicyLoader, EmptyFileSections_UseDefaults) {
    const TempYaml yaml("role_table:\n  guest: [chat]\n");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_TRUE(result.has_value()) << result.error();

    EXPECT_EQ(result->sanitizer.pii_mode, SanitizeMode::kMask);
    EXPECT_EQ(result->risk.risk_threshold_block, 70u);
    EXPECT_EQ(result->upstream.max_attempts, 2u);
    EXPECT_DOUBLE_EQ(result->injection.settings.threshold, 0.5);
}

TEST(PolicyLoader, UnknownPiiMode_ReturnsError) {
    const TempYaml yaml("sanitizer:\n  pii_mode: scramble\n");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("pii_mode"), std::string::npos) << result.error();
}

TEST(PolicyLoader, UnknownAction_ReturnsError) {
    const TempYaml yaml(R"(
policy_rules:
  - id: r1
    role: guest
    intent: chat
    action: maybe
)");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("unknown action 'maybe'"), std::string::npos) << result.error();
}

TEST(PolicyLoader, UnknownIntentInRoleTable_ReturnsError) {
    const TempYaml yaml("role_table:\n  guest: [chat, gossip]\n");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("gossip"), std::string::npos) << result.error();
}

TEST(PolicyLoader, RiskThresholdAbove100_ReturnsError) {
    const TempYaml yaml("risk:\n  risk_threshold_block: 101\n");
    EXPECT_FALSE(PolicyLoader::load(yaml.path()).has_value());
}

TEST(PolicyLoader, InjectionThresholdOutOfRange_ReturnsError) {
    const TempYaml yaml("injection:\n  threshold: 1.0\n");
    EXPECT_FALSE(PolicyLoader::load(yaml.path()).has_value());
}

TEST(PolicyLoader, ZeroWorkerThreadsOrAttempts_ReturnsError) {
    const TempYaml threads("global:\n  worker_threads: 0\n");
    EXPECT_FALSE(PolicyLoader::load(threads.path()).has_value());

    const TempYaml attempts("upstream:\n  max_attempts: 0\n");
    EXPECT_FALSE(PolicyLoader::load(attempts.path()).has_value());

    const TempYaml timeout("upstream:\n  timeout_ms: 0\n");
    EXPECT_FALSE(PolicyLoader::load(timeout.path()).has_value());
}

TEST(PolicyLoader, ConflictingRules_ReturnsError) {
    const TempYaml yaml(R"(
policy_rules:
  - id: allow-tool
    role: guest
    intent: tool
    action: allow
    priority: 30
  - id: block-tool
    role: guest
    intent: tool
    action: block
    priority: 30
)");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("conflicting"), std::string::npos) << result.error();
}

// role_table 확장 규칙(priority 10, allow)과 충돌하는 명시 규칙도 거부된다
TEST(PolicyLoader, RuleConflictingWithRoleTable_ReturnsError) {
    const TempYaml yaml(R"(
role_table:
  guest: [chat]
policy_rules:
  - id: guest-chat-block
    role: guest
    intent: chat
    action: block
    priority: 10
)");
    EXPECT_FALSE(PolicyLoader::load(yaml.path()).has_value());
}

TEST(PolicyLoader, EmptyInjectionRules_ConfiguredButEmpty) {
    const TempYaml yaml("injection:\n  rules: []\n");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_TRUE(result->injection.rules_configured);
    EXPECT_TRUE(result->injection.rules.empty());
}

TEST(PolicyLoader, CustomInjectionRulesAndVocabularies) {
    const TempYaml yaml(R"(
injection:
  rules:
    - id: 1
      pattern: "open sesame"
      weight: 0.8
      description: magic words
intents:
  min_score: 0.5
  vocabularies:
    tool:
      - deploy
      - { phrase: "roll back", weight: 2.0 }
)");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_TRUE(result.has_value()) << result.error();

    ASSERT_EQ(result->injection.rules.size(), 1u);
    EXPECT_EQ(result->injection.rules[0].pattern, "open sesame");
    EXPECT_DOUBLE_EQ(result->injection.rules[0].weight, 0.8);

    EXPECT_TRUE(result->intents.vocabularies_configured);
    EXPECT_DOUBLE_EQ(result->intents.min_score, 0.5);
    ASSERT_EQ(result->intents.vocabularies.size(), 1u);
    EXPECT_EQ(result->intents.vocabularies[0].label, IntentLabel::kTool);
    ASSERT_EQ(result->intents.vocabularies[0].phrases.size(), 2u);
    EXPECT_DOUBLE_EQ(result->intents.vocabularies[0].phrases[1].weight, 2.0);
}

TEST(PolicyLoader, InjectionRuleWithUnboundedRepetition_Rejected) {
    const TempYaml yaml(R"(
injection:
  rules:
    - id: 7
      pattern: "ignore\\s+previous"
      weight: 0.8
)");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("injection rule 7"), std::string::npos) << result.error();
}

TEST(PolicyLoader, InjectionRuleWithBoundedRepetition_Accepted) {
    const TempYaml yaml(R"(
injection:
  rules:
    - id: 7
      pattern: "ignore\\s{1,8}previous"
      weight: 0.8
)");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_TRUE(result.has_value()) << result.error();
    ASSERT_EQ(result->injection.rules.size(), 1u);
}

TEST(PolicyLoader, RateLimitSection_RoleOverridesInheritDefaults) {
    const TempYaml yaml(R"(
rate_limit:
  enabled: true
  requests_per_second: 5
  burst: 8
  max_callers: 100
  roles:
    Guest: { burst: 2 }
    admin: { requests_per_second: 40, burst: 80 }
)");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_TRUE(result.has_value()) << result.error();

    const auto& rl = result->rate_limit;
    EXPECT_TRUE(rl.enabled);
    EXPECT_EQ(rl.defaults.requests_per_second, 5u);
    EXPECT_EQ(rl.defaults.burst, 8u);
    EXPECT_EQ(rl.max_callers, 100u);
    ASSERT_EQ(rl.roles.count("guest"), 1u);
    EXPECT_EQ(rl.roles.at("guest").requests_per_second, 5u);
    EXPECT_EQ(rl.roles.at("guest").burst, 2u);
    EXPECT_EQ(rl.roles.at("admin").requests_per_second, 40u);
}

TEST(PolicyLoader, RateLimitMissing_Disabled) {
    const TempYaml yaml("role_table:\n  guest: [chat]\n");
    const auto result = PolicyLoader::load(yaml.path());
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_FALSE(result->rate_limit.enabled);
}

TEST(PolicyLoader, RateLimitZeroValues_ReturnsError) {
    const TempYaml zero_rate("rate_limit:\n  requests_per_second: 0\n");
    const auto a = PolicyLoader::load(zero_rate.path());
    ASSERT_FALSE(a.has_value());
    EXPECT_NE(a.error().find("rate_limit"), std::string::npos) << a.error();

    const TempYaml zero_burst("rate_limit:\n  roles:\n    guest: { burst: 0 }\n");
    const auto b = PolicyLoader::load(zero_burst.path());
    ASSERT_FALSE(b.has_value());
    EXPECT_NE(b.error().find("rate_limit.roles.guest"), std::string::npos) << b.error();

    const TempYaml zero_callers("rate_limit:\n  max_callers: 0\n");
    EXPECT_FALSE(PolicyLoader::load(zero_callers.path()).has_value());
}

TEST(PolicyLoader, MalformedYaml_ReturnsError) {
    const TempYaml yaml("role_table: [unclosed\n");
    EXPECT_FALSE(PolicyLoader::load(yaml.path()).has_value());
}

// ===========================================================================
// 6. config/gateway.yaml 실제 로딩
// ===========================================================================

TEST(PolicyLoader, LoadShippedGatewayYaml_Succeeds) {
    const std::filesystem::path path =
        std::filesystem::path(PROMPTGATE_SOURCE_DIR) / "config" / "gateway.yaml";
    if (!std::filesystem::exists(path)) {
        GTEST_SKIP() << "config/gateway.yaml not found, skipping test";
    }

    const auto result = PolicyLoader::load(path);
    ASSERT_TRUE(result.has_value())
        << "config/gateway.yaml should parse successfully. error='" << result.error() << "'";

    const PolicyEngine engine(std::make_shared<const PolicyTable>(result->policy));
    EXPECT_EQ(engine.decide("guest", IntentLabel::kAdmin, InjectionVerdict{}).action,
              PolicyAction::kBlock);
    EXPECT_EQ(engine.decide("guest", IntentLabel::kSummarize, InjectionVerdict{}).action,
              PolicyAction::kAllowWithSanitize);
    EXPECT_EQ(engine.decide("admin", IntentLabel::kUnknown, InjectionVerdict{}).matched_rule,
              "unknown-intent-block");
    EXPECT_EQ(engine.max_tokens_for("developer").value_or(0), 2048u);

    EXPECT_TRUE(result->rate_limit.enabled);
    EXPECT_EQ(result->rate_limit.roles.at("guest").burst, 5u);
}
