#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 게이트웨이 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/gateway.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 값 타입 정의 헤더(common/types, detector 규칙 레코드)에만
//   의존한다. policy_engine.hpp / policy_loader.hpp 를 include 하지 않는다.
// - 모든 멤버는 기본값을 명시한다. YAML 에 키가 없으면 이 기본값이 쓰인다.
// - 정책 평가 실패 시 항상 kBlock (fail-close). 이 구조체 자체는
//   판정 로직을 포함하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "detector/injection_detector.hpp"  // InjectionRule, InjectionSettings
#include "detector/intent_classifier.hpp"   // IntentVocabulary

// ---------------------------------------------------------------------------
// GlobalConfig
//   전역 설정값.
//   log_level: "trace"|"debug"|"info"|"warn"|"error"|"critical"
//   audit_path 가 빈 문자열이면 감사 체인은 메모리에만 유지된다 (테스트용).
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string   log_level{"info"};
    std::string   log_path{"/tmp/promptgate.log"};
    std::string   audit_path{"/tmp/promptgate_audit.jsonl"};
    std::string   uds_socket_path{"/tmp/promptgate.sock"};
    std::uint32_t worker_threads{4};
};

// ---------------------------------------------------------------------------
// SanitizerConfig
//   pii_mode 는 런타임 설정. reload 시 탐지 규칙 재컴파일 없이 교체된다.
// ---------------------------------------------------------------------------
struct SanitizerConfig {
    SanitizeMode pii_mode{SanitizeMode::kMask};
};

struct RiskConfig {
    std::uint32_t risk_threshold_block{70};  // 이 점수 이상이면 정책과 무관하게 차단
};

// ---------------------------------------------------------------------------
// UpstreamConfig
//   모델 백엔드 접속 정보.
//   max_attempts 는 총 시도 횟수 (1 = 재시도 없음). 타임아웃은 재시도하지 않는다.
// ---------------------------------------------------------------------------
struct UpstreamConfig {
    std::string   host{"127.0.0.1"};
    std::uint16_t port{8000};
    std::string   target{"/v1/completions"};
    std::string   model{"default"};
    std::uint32_t timeout_ms{10000};
    std::uint32_t max_attempts{2};
    std::size_t   max_response_bytes{1024 * 1024};
};

// ---------------------------------------------------------------------------
// RateLimitConfig
//   역할 × 호출자별 토큰 버킷. roles 에 없는 역할은 defaults 를 쓴다.
//   기동 시 고정되며 reload 로 바뀌지 않는다.
// ---------------------------------------------------------------------------
struct RateLimit {
    std::uint32_t requests_per_second{10};
    std::uint32_t burst{20};
};

struct RateLimitConfig {
    bool                             enabled{false};
    RateLimit                        defaults{};
    std::map<std::string, RateLimit> roles{};        // 역할 이름은 소문자
    std::size_t                      max_callers{10000};
};

struct IntakeConfig {
    std::size_t   max_prompt_bytes{128 * 1024};
    std::uint32_t max_tokens_limit{4096};
    std::uint32_t default_max_tokens{256};
    double        default_temperature{0.7};
};

// ---------------------------------------------------------------------------
// InjectionConfig
//   rules_configured=false 이면 InjectionDetector::default_rules() 사용.
//   rules_configured=true 인데 rules 가 비어 있으면 탐지기는 degraded 로 동작.
// ---------------------------------------------------------------------------
struct InjectionConfig {
    InjectionSettings          settings{};
    std::vector<InjectionRule> rules{};
    bool                       rules_configured{false};
};

struct IntentConfig {
    double                        min_score{IntentClassifier::kDefaultMinScore};
    std::vector<IntentVocabulary> vocabularies{};
    bool                          vocabularies_configured{false};
};

// ---------------------------------------------------------------------------
// PolicyRule
//   role, intent 는 "*" 와일드카드 허용. 역할 비교는 대소문자 무시.
//   priority 가 클수록 우선. 동일 priority 에서는 정확 일치가 와일드카드보다,
//   더 제한적인 action 이 덜 제한적인 action 보다 우선한다.
// ---------------------------------------------------------------------------
struct PolicyRule {
    std::string  id{};
    std::string  role{"*"};
    std::string  intent{"*"};  // IntentLabel 문자열 또는 "*"
    PolicyAction action{PolicyAction::kBlock};
    std::int32_t priority{0};
};

// ---------------------------------------------------------------------------
// PolicyTable
//   role_table: 역할 → 허용 intent 목록 (priority 10 의 allow 규칙으로 확장)
//   rules:      명시적 정책 규칙
//   role_max_tokens: 역할별 max_tokens 상한
// ---------------------------------------------------------------------------
struct PolicyTable {
    std::vector<PolicyRule>                         rules{};
    std::map<std::string, std::vector<IntentLabel>> role_table{};
    std::map<std::string, std::uint32_t>            role_max_tokens{};
};

// ---------------------------------------------------------------------------
// GatewayConfig
//   전체 설정의 루트 구조체. PolicyLoader::load 가 반환하는 최종 결과물.
//
//   [Hot Reload 고려사항]
//   - sanitizer / risk / upstream(타임아웃, 시도 횟수) / intake 는 reload 로 교체.
//   - injection / intents / policy 규칙 테이블은 기동 시 한 번만 적재한다.
// ---------------------------------------------------------------------------
struct GatewayConfig {
    GlobalConfig    global{};
    SanitizerConfig sanitizer{};
    RiskConfig      risk{};
    UpstreamConfig  upstream{};
    IntakeConfig    intake{};
    RateLimitConfig rate_limit{};
    InjectionConfig injection{};
    IntentConfig    intents{};
    PolicyTable     policy{};
};
