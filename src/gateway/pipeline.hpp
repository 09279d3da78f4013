#pragma once

// ---------------------------------------------------------------------------
// pipeline.hpp
//
// 요청 한 건을 검사하고 단일 SecurityVerdict 를 만드는 파이프라인.
//
// [단계 순서 (요청마다 고정)]
//   1. Intake          : 정규화, 기본값, 요청 id
//      RateLimit       : 역할 × 호출자 토큰 버킷. 초과하면 나머지 단계 없이 차단
//   2. Injection       : 인젝션/탈옥 판정
//   3. Intent          : 의도 분류
//   4. Policy          : role × intent × injection → action
//   5. PII             : 프롬프트 PII 탐지/변환 (모델로 보내기 전)
//      사전 위험도     : 2~5 단계 신호로 점수 계산, 임계값 이상이면 차단
//   6. Model           : 변환된 프롬프트로 모델 호출 (타임아웃/재시도/취소)
//   7. ResponseGuard   : 응답의 비밀값/PII 필터링
//   8. Risk            : 최종 위험도
//   9. Audit           : verdict 스냅샷을 해시 체인에 기록
//
// [판정 우선순위, 가장 이른 단계의 차단 사유가 이긴다]
//   invalid_request > rate_limited > detection_degraded > injection > policy_denied >
//   risk_threshold(사전) > cancelled / upstream_timeout / upstream_unavailable >
//   response_secret_leak > risk_threshold(최종)
//   audit_write_failure 는 위 모든 사유를 덮어쓴다 (verdict 신뢰 불가).
//   정책 차단은 모델 호출 전에 끝나므로 응답 유출과 동시에 발생할 수 없다.
//
// [fail-close 원칙]
// - handle() 은 예외를 밖으로 던지지 않는다. 단계 안의 std::exception 은
//   reason=internal_error 의 block verdict 가 된다.
// - 부분 verdict 를 반환하지 않는다. 취소된 요청도 감사 항목을 남긴다.
// - 감사 기록에 실패한 verdict 는 block + audited=false 로 반환하고
//   모델 응답은 돌려주지 않는다.
//
// [스레드 안전성]
// 규칙 테이블(탐지기, 분류기, 정책, PII 규칙)은 생성 후 읽기 전용이다.
// 속도 제한 버킷은 RateLimiter 내부 mutex 로 보호된다.
// 런타임 설정(pii_mode, 임계값, 타임아웃, intake 제한)은
// std::atomic<std::shared_ptr<const RuntimeSettings>> 로 교체된다.
// 감사 체인 append 만 AuditLogger 내부 mutex 로 직렬화된다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>

#include "audit/audit_logger.hpp"
#include "common/cancellation.hpp"
#include "common/types.hpp"
#include "detector/injection_detector.hpp"
#include "detector/intent_classifier.hpp"
#include "gateway/request_intake.hpp"
#include "gateway/security_verdict.hpp"
#include "guard/response_guard.hpp"
#include "logger/structured_logger.hpp"
#include "pii/pii_sanitizer.hpp"
#include "policy/policy_engine.hpp"
#include "policy/rule.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "risk/risk_scorer.hpp"
#include "stats/stats_collector.hpp"
#include "upstream/model_client.hpp"
#include "upstream/model_invoker.hpp"

// ---------------------------------------------------------------------------
// RuntimeSettings
//   reload 로 교체되는 설정 묶음. 규칙 테이블은 포함하지 않는다.
// ---------------------------------------------------------------------------
struct RuntimeSettings {
    SanitizeMode              pii_mode{SanitizeMode::kMask};
    std::uint32_t             risk_threshold_block{70};
    std::chrono::milliseconds upstream_timeout{10000};
    std::uint32_t             max_attempts{2};
    IntakeConfig              intake{};
    std::string               default_model{};

    [[nodiscard]] static RuntimeSettings from(const GatewayConfig& cfg);
};

class Pipeline {
public:
    // create
    //   설정에서 모든 단계를 구성한다.
    //   logger, stats 는 nullptr 허용 (구조화 로그/통계 생략).
    //   client, audit 가 없거나 구성 중 예외가 나면 kConfigurationError.
    [[nodiscard]] static std::expected<std::unique_ptr<Pipeline>, GateError> create(
        const GatewayConfig&              cfg,
        std::shared_ptr<ModelClient>      client,
        std::shared_ptr<AuditLogger>      audit,
        std::shared_ptr<StructuredLogger> logger,
        std::shared_ptr<StatsCollector>   stats);

    ~Pipeline() = default;

    Pipeline(const Pipeline&)            = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // handle
    //   단일 진입점. 어떤 경우에도 완성된 verdict 를 반환한다.
    [[nodiscard]] GatewayResponse handle(const RawRequest&        raw,
                                         const CancellationToken& cancel = {});

    // update_settings
    //   런타임 설정만 원자적으로 교체한다. 진행 중인 요청은 이전 설정으로 끝난다.
    void update_settings(const GatewayConfig& cfg);

    [[nodiscard]] std::shared_ptr<const RuntimeSettings> settings() const;
    [[nodiscard]] const AuditLogger& audit() const noexcept { return *audit_; }
    [[nodiscard]] bool detection_degraded() const noexcept { return injection_.degraded(); }

private:
    // Outcome
    //   감사 기록 전의 요청 처리 결과.
    struct Outcome {
        SecurityVerdict            verdict{};
        std::optional<std::string> response_text{};
        std::string                sanitized_prompt{};
        std::string                role{};
        std::string                block_detail{};
        bool                       upstream_failure{false};
    };

    Pipeline(const GatewayConfig&              cfg,
             std::shared_ptr<ModelClient>      client,
             std::shared_ptr<AuditLogger>      audit,
             std::shared_ptr<StructuredLogger> logger,
             std::shared_ptr<StatsCollector>   stats);

    [[nodiscard]] Outcome run(const RawRequest&        raw,
                              const RuntimeSettings&   settings,
                              const CancellationToken& cancel);

    [[nodiscard]] GatewayResponse finalize(Outcome                                outcome,
                                           std::chrono::steady_clock::time_point started);

    // 통계/구조화 로그 기록. 감사 이후 단계라 판정을 바꾸지 않는다.
    void observe(const Outcome& outcome, std::chrono::steady_clock::time_point started);

    InjectionDetector                  injection_;
    IntentClassifier                   intent_;
    PolicyEngine                       policy_;
    PiiSanitizer                       sanitizer_;
    ResponseGuard                      guard_;
    RiskScorer                         scorer_;
    ModelInvoker                       invoker_;
    RequestIntake                      intake_;
    RateLimiter                        rate_limiter_;
    std::shared_ptr<AuditLogger>       audit_;
    std::shared_ptr<StructuredLogger>  logger_;
    std::shared_ptr<StatsCollector>    stats_;

    std::atomic<std::shared_ptr<const RuntimeSettings>> settings_;
};
