// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 설정 파일을 로드하여 GatewayConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - 이름으로 지정하는 enum 값(pii_mode, action, intent)은 모르는 이름이면
//   실패로 처리한다. 오타가 조용히 기본값(또는 차단)으로 바뀌는 것을 막는다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [injection.rules 처리]
// - 키 없음       → rules_configured=false (기본 규칙 사용)
// - 빈 시퀀스     → rules_configured=true, rules 비어 있음
//                   → InjectionDetector degraded → 모든 요청 차단
//   운영자가 의도적으로 비운 경우도 기동은 허용하되 경고를 남긴다.
//
// - 상한 없는 반복('*', '+', '{n,}')이 있는 규칙은 로드 실패로 처리한다.
//   긴 토큰에서 정규식 실행기가 스택을 넘칠 수 있기 때문이다.
//
// [오탐/미탐 트레이드오프]
// - 잘못된 regex 규칙은 InjectionDetector 가 건너뛴다 (false negative 증가).
//   로드 시점에 경고를 출력하여 운영자에게 알린다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <filesystem>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include "common/regex_bounds.hpp"
#include "policy/policy_engine.hpp"  // expand, find_conflict

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: regex 패턴이 유효한지 사전 검증하고 경고 로그를 출력한다.
// ---------------------------------------------------------------------------
void validate_injection_patterns(const std::vector<InjectionRule>& rules) {
    for (const auto& r : rules) {
        try {
            const std::regex re(r.pattern,
                                std::regex_constants::icase | std::regex_constants::ECMAScript);
            static_cast<void>(re.mark_count());
        } catch (const std::regex_error& e) {
            spdlog::warn(
                "policy_loader: injection rule {} has invalid regex and will be skipped; "
                "false negative risk: {}",
                r.id, e.what()
            );
        }
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 값 읽기. 없으면 fallback 반환.
// 타입 변환 실패(YAML::BadConversion)는 섹션 단위 catch 로 전파되어
// 설정 오류가 된다.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] T read_scalar(const YAML::Node& node, const T& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<T>();
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    return read_scalar<std::string>(node, fallback);
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: GlobalConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<GlobalConfig, std::string> parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    cfg.log_level       = read_string(node["log_level"],       cfg.log_level);
    cfg.log_path        = read_string(node["log_path"],        cfg.log_path);
    cfg.audit_path      = read_string(node["audit_path"],      cfg.audit_path);
    cfg.uds_socket_path = read_string(node["uds_socket_path"], cfg.uds_socket_path);
    cfg.worker_threads  = read_scalar<std::uint32_t>(node["worker_threads"], cfg.worker_threads);

    if (cfg.worker_threads == 0) {
        return std::unexpected("global.worker_threads must be at least 1");
    }
    return cfg;
}

[[nodiscard]] std::expected<SanitizerConfig, std::string> parse_sanitizer(const YAML::Node& node) {
    SanitizerConfig cfg{};
    if (!node || !node.IsMap() || !node["pii_mode"]) {
        return cfg;
    }
    const auto name = read_string(node["pii_mode"], "");
    const auto mode = parse_sanitize_mode(name);
    if (!mode) {
        return std::unexpected(fmt::format(
            "sanitizer.pii_mode '{}' is not one of detect|mask|redact", name));
    }
    cfg.pii_mode = *mode;
    return cfg;
}

[[nodiscard]] std::expected<RiskConfig, std::string> parse_risk(const YAML::Node& node) {
    RiskConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.risk_threshold_block =
        read_scalar<std::uint32_t>(node["risk_threshold_block"], cfg.risk_threshold_block);
    if (cfg.risk_threshold_block > 100) {
        return std::unexpected(fmt::format(
            "risk.risk_threshold_block {} is outside 0..100", cfg.risk_threshold_block));
    }
    return cfg;
}

[[nodiscard]] std::expected<UpstreamConfig, std::string> parse_upstream(const YAML::Node& node) {
    UpstreamConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.host         = read_string(node["host"],   cfg.host);
    cfg.port         = read_scalar<std::uint16_t>(node["port"], cfg.port);
    cfg.target       = read_string(node["target"], cfg.target);
    cfg.model        = read_string(node["model"],  cfg.model);
    cfg.timeout_ms   = read_scalar<std::uint32_t>(node["timeout_ms"],   cfg.timeout_ms);
    cfg.max_attempts = read_scalar<std::uint32_t>(node["max_attempts"], cfg.max_attempts);
    cfg.max_response_bytes =
        read_scalar<std::size_t>(node["max_response_bytes"], cfg.max_response_bytes);

    if (cfg.max_attempts == 0) {
        return std::unexpected("upstream.max_attempts must be at least 1");
    }
    if (cfg.timeout_ms == 0) {
        return std::unexpected("upstream.timeout_ms must be positive");
    }
    if (cfg.max_response_bytes == 0) {
        return std::unexpected("upstream.max_response_bytes must be positive");
    }
    return cfg;
}

[[nodiscard]] std::expected<IntakeConfig, std::string> parse_intake(const YAML::Node& node) {
    IntakeConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.max_prompt_bytes   = read_scalar<std::size_t>(node["max_prompt_bytes"], cfg.max_prompt_bytes);
    cfg.max_tokens_limit   = read_scalar<std::uint32_t>(node["max_tokens_limit"], cfg.max_tokens_limit);
    cfg.default_max_tokens = read_scalar<std::uint32_t>(node["default_max_tokens"], cfg.default_max_tokens);
    cfg.default_temperature = read_scalar<double>(node["default_temperature"], cfg.default_temperature);

    if (cfg.max_prompt_bytes == 0 || cfg.max_tokens_limit == 0) {
        return std::unexpected("intake limits must be positive");
    }
    if (cfg.default_max_tokens == 0 || cfg.default_max_tokens > cfg.max_tokens_limit) {
        return std::unexpected(fmt::format(
            "intake.default_max_tokens {} must be in 1..{}",
            cfg.default_max_tokens, cfg.max_tokens_limit));
    }
    if (cfg.default_temperature < 0.0 || cfg.default_temperature > 2.0) {
        return std::unexpected("intake.default_temperature must be in [0, 2]");
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: RateLimitConfig 파싱
// rate_limit:
//   enabled: true
//   requests_per_second: 10
//   burst: 20
//   roles: { guest: { requests_per_second: 1, burst: 5 } }
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<RateLimit, std::string> parse_limit(const YAML::Node& node,
                                                                const RateLimit&  fallback,
                                                                const std::string& where) {
    RateLimit limit = fallback;
    limit.requests_per_second =
        read_scalar<std::uint32_t>(node["requests_per_second"], limit.requests_per_second);
    limit.burst = read_scalar<std::uint32_t>(node["burst"], limit.burst);
    if (limit.requests_per_second == 0 || limit.burst == 0) {
        return std::unexpected(fmt::format(
            "{}: requests_per_second and burst must be positive", where));
    }
    return limit;
}

[[nodiscard]] std::expected<RateLimitConfig, std::string> parse_rate_limit(const YAML::Node& node) {
    RateLimitConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.enabled     = read_scalar<bool>(node["enabled"], cfg.enabled);
    cfg.max_callers = read_scalar<std::size_t>(node["max_callers"], cfg.max_callers);
    if (cfg.max_callers == 0) {
        return std::unexpected("rate_limit.max_callers must be positive");
    }

    auto defaults = parse_limit(node, cfg.defaults, "rate_limit");
    if (!defaults) {
        return std::unexpected(defaults.error());
    }
    cfg.defaults = *defaults;

    const YAML::Node& roles = node["roles"];
    if (roles && roles.IsMap()) {
        for (const auto& entry : roles) {
            const auto role = entry.first.as<std::string>();
            if (!entry.second.IsMap()) {
                return std::unexpected(fmt::format("rate_limit.roles.{} is not a map", role));
            }
            auto limit = parse_limit(entry.second, cfg.defaults, "rate_limit.roles." + role);
            if (!limit) {
                return std::unexpected(limit.error());
            }
            std::string key = role;
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            cfg.roles[key] = *limit;
        }
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: InjectionConfig 파싱
// rules:
//   - { id: 1, pattern: "...", weight: 0.95, description: "..." }
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<InjectionConfig, std::string> parse_injection(const YAML::Node& node) {
    InjectionConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    cfg.settings.threshold = read_scalar<double>(node["threshold"], cfg.settings.threshold);
    cfg.settings.short_circuit_confidence =
        read_scalar<double>(node["short_circuit_confidence"], cfg.settings.short_circuit_confidence);

    if (cfg.settings.threshold < 0.0 || cfg.settings.threshold >= 1.0) {
        return std::unexpected("injection.threshold must be in [0, 1)");
    }
    if (cfg.settings.short_circuit_confidence <= 0.0 || cfg.settings.short_circuit_confidence > 1.0) {
        return std::unexpected("injection.short_circuit_confidence must be in (0, 1]");
    }

    const YAML::Node& rules_node = node["rules"];
    if (!rules_node) {
        return cfg;
    }
    if (!rules_node.IsSequence()) {
        return std::unexpected("injection.rules must be a sequence");
    }

    cfg.rules_configured = true;
    cfg.rules.reserve(rules_node.size());
    for (const auto& rule_node : rules_node) {
        if (!rule_node.IsMap() || !rule_node["id"] || !rule_node["pattern"]) {
            return std::unexpected("injection.rules entries need 'id' and 'pattern'");
        }
        InjectionRule rule{};
        rule.id          = rule_node["id"].as<std::uint32_t>();
        rule.pattern     = rule_node["pattern"].as<std::string>();
        rule.weight      = read_scalar<double>(rule_node["weight"], 0.5);
        rule.description = read_string(rule_node["description"], "");
        if (has_unbounded_repetition(rule.pattern)) {
            return std::unexpected(fmt::format(
                "injection rule {}: pattern needs an upper bound on every repetition "
                "(use {{m,n}} with n <= {} instead of '*', '+' or '{{n,}}')",
                rule.id, kMaxRepetitionBound));
        }
        cfg.rules.push_back(std::move(rule));
    }

    if (cfg.rules.empty()) {
        spdlog::warn("policy_loader: injection.rules is empty; detection will run degraded "
                     "and every request will be blocked");
    }
    validate_injection_patterns(cfg.rules);
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: IntentConfig 파싱
// vocabularies:
//   chat: [{ phrase: "hello", weight: 1.0 }, "thanks"]
// 문자열 항목은 weight 1.0 으로 취급한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<IntentConfig, std::string> parse_intents(const YAML::Node& node) {
    IntentConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.min_score = read_scalar<double>(node["min_score"], cfg.min_score);
    if (cfg.min_score <= 0.0) {
        return std::unexpected("intents.min_score must be positive");
    }

    const YAML::Node& vocab_node = node["vocabularies"];
    if (!vocab_node) {
        return cfg;
    }
    if (!vocab_node.IsMap()) {
        return std::unexpected("intents.vocabularies must be a map of intent -> phrases");
    }

    cfg.vocabularies_configured = true;
    for (const auto& entry : vocab_node) {
        const auto name  = entry.first.as<std::string>();
        const auto label = parse_intent_label(name);
        if (!label || *label == IntentLabel::kUnknown) {
            return std::unexpected(fmt::format("intents.vocabularies: unknown intent '{}'", name));
        }

        IntentVocabulary vocab{*label, {}};
        if (entry.second.IsSequence()) {
            for (const auto& item : entry.second) {
                if (item.IsScalar()) {
                    vocab.phrases.push_back(IntentPhrase{item.as<std::string>(), 1.0});
                } else if (item.IsMap()) {
                    vocab.phrases.push_back(IntentPhrase{
                        read_string(item["phrase"], ""),
                        read_scalar<double>(item["weight"], 1.0),
                    });
                }
            }
        }
        cfg.vocabularies.push_back(std::move(vocab));
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: PolicyTable 파싱 (role_table, policy_rules, role_max_tokens)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<PolicyTable, std::string> parse_policy(const YAML::Node& root) {
    PolicyTable table{};

    const YAML::Node& role_node = root["role_table"];
    if (role_node && role_node.IsMap()) {
        for (const auto& entry : role_node) {
            const auto role = entry.first.as<std::string>();
            std::vector<IntentLabel> intents;
            for (const auto& name : read_string_sequence(entry.second)) {
                const auto label = parse_intent_label(name);
                if (!label) {
                    return std::unexpected(fmt::format(
                        "role_table.{}: unknown intent '{}'", role, name));
                }
                intents.push_back(*label);
            }
            table.role_table[role] = std::move(intents);
        }
    }

    const YAML::Node& rules_node = root["policy_rules"];
    if (rules_node && rules_node.IsSequence()) {
        std::size_t index = 0;
        for (const auto& rule_node : rules_node) {
            ++index;
            if (!rule_node.IsMap()) {
                return std::unexpected(fmt::format("policy_rules[{}] is not a map", index - 1));
            }
            PolicyRule rule{};
            rule.id       = read_string(rule_node["id"], fmt::format("policy_rule:{}", index - 1));
            rule.role     = read_string(rule_node["role"], "*");
            rule.intent   = read_string(rule_node["intent"], "*");
            rule.priority = read_scalar<std::int32_t>(rule_node["priority"], 0);

            if (rule.intent != "*" && !parse_intent_label(rule.intent)) {
                return std::unexpected(fmt::format(
                    "policy_rules '{}': unknown intent '{}'", rule.id, rule.intent));
            }
            const auto action_name = read_string(rule_node["action"], "");
            const auto action      = parse_policy_action(action_name);
            if (!action) {
                return std::unexpected(fmt::format(
                    "policy_rules '{}': unknown action '{}'", rule.id, action_name));
            }
            rule.action = *action;
            table.rules.push_back(std::move(rule));
        }
    }

    const YAML::Node& tokens_node = root["role_max_tokens"];
    if (tokens_node && tokens_node.IsMap()) {
        for (const auto& entry : tokens_node) {
            table.role_max_tokens[entry.first.as<std::string>()] = entry.second.as<std::uint32_t>();
        }
    }

    if (const auto conflict = PolicyEngine::find_conflict(PolicyEngine::expand(table))) {
        return std::unexpected(*conflict);
    }
    return table;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 섹션 하나를 파싱하고 결과를 target 에 옮긴다.
// YAML 타입 변환 예외와 의미 오류를 같은 형식의 오류 문자열로 만든다.
// ---------------------------------------------------------------------------
template <typename T, typename Parser>
[[nodiscard]] std::expected<void, std::string> parse_section(
    const char* section, T& target, Parser&& parser) {
    try {
        auto parsed = parser();
        if (!parsed) {
            return std::unexpected(fmt::format(
                "policy_loader: invalid '{}' section: {}", section, parsed.error()));
        }
        target = std::move(*parsed);
        return {};
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "policy_loader: error parsing '{}' section: {}", section, e.what()));
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<GatewayConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화 (path traversal 방지 목적)
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading config from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "policy_loader: '{}' is not a valid YAML map (top-level)",
            canonical_path.string()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 각 섹션 파싱 (섹션 단위 오류 보고)
    GatewayConfig cfg{};

    const std::expected<void, std::string> results[] = {
        parse_section("global",    cfg.global,    [&] { return parse_global(root["global"]); }),
        parse_section("sanitizer", cfg.sanitizer, [&] { return parse_sanitizer(root["sanitizer"]); }),
        parse_section("risk",      cfg.risk,      [&] { return parse_risk(root["risk"]); }),
        parse_section("upstream",  cfg.upstream,  [&] { return parse_upstream(root["upstream"]); }),
        parse_section("intake",    cfg.intake,    [&] { return parse_intake(root["intake"]); }),
        parse_section("rate_limit", cfg.rate_limit, [&] { return parse_rate_limit(root["rate_limit"]); }),
        parse_section("injection", cfg.injection, [&] { return parse_injection(root["injection"]); }),
        parse_section("intents",   cfg.intents,   [&] { return parse_intents(root["intents"]); }),
        parse_section("policy",    cfg.policy,    [&] { return parse_policy(root); }),
    };

    for (const auto& result : results) {
        if (!result) {
            spdlog::error("{}", result.error());
            return std::unexpected(result.error());
        }
    }

    spdlog::info(
        "policy_loader: config loaded successfully; "
        "roles={}, policy_rules={}, injection_rules={}, pii_mode={}, risk_threshold_block={}",
        cfg.policy.role_table.size(),
        cfg.policy.rules.size(),
        cfg.injection.rules_configured ? cfg.injection.rules.size()
                                       : InjectionDetector::default_rules().size(),
        to_string(cfg.sanitizer.pii_mode),
        cfg.risk.risk_threshold_block
    );

    return cfg;
}
