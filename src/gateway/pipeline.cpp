#include "gateway/pipeline.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <vector>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

// 규칙이 하나도 컴파일되지 않은 탐지기는 아무것도 가리지 못하므로 구성 실패로 본다.
std::shared_ptr<const PiiDetector> compile_detector(std::vector<PiiRule> rules, const char* name) {
    auto detector = std::make_shared<const PiiDetector>(std::move(rules));
    if (detector->rule_count() == 0) {
        throw std::runtime_error(fmt::format("{} rule table compiled to zero rules", name));
    }
    spdlog::debug("[pipeline] {} detector: {} rules", name, detector->rule_count());
    return detector;
}

std::shared_ptr<const PiiDetector> make_pii_detector() {
    return compile_detector(PiiDetector::default_rules(), "pii");
}

std::shared_ptr<const PiiDetector> make_secret_detector() {
    return compile_detector(PiiDetector::default_secret_rules(), "secret");
}

// 차단 사유 기록. 이미 차단된 verdict 는 덮어쓰지 않는다 (가장 이른 단계 우선).
void block(SecurityVerdict& v, DecisionReason reason) {
    if (v.decision == Decision::kBlock && v.reason != DecisionReason::kNone) {
        return;
    }
    v.decision = Decision::kBlock;
    v.reason   = reason;
}

}  // namespace

RuntimeSettings RuntimeSettings::from(const GatewayConfig& cfg) {
    return RuntimeSettings{
        .pii_mode             = cfg.sanitizer.pii_mode,
        .risk_threshold_block = cfg.risk.risk_threshold_block,
        .upstream_timeout     = std::chrono::milliseconds(cfg.upstream.timeout_ms),
        .max_attempts         = cfg.upstream.max_attempts,
        .intake               = cfg.intake,
        .default_model        = cfg.upstream.model,
    };
}

Pipeline::Pipeline(const GatewayConfig&              cfg,
                   std::shared_ptr<ModelClient>      client,
                   std::shared_ptr<AuditLogger>      audit,
                   std::shared_ptr<StructuredLogger> logger,
                   std::shared_ptr<StatsCollector>   stats)
    : injection_(cfg.injection.rules_configured ? cfg.injection.rules
                                                : InjectionDetector::default_rules(),
                 cfg.injection.settings)
    , intent_(cfg.intents.vocabularies_configured ? cfg.intents.vocabularies
                                                  : IntentClassifier::default_vocabularies(),
              cfg.intents.min_score)
    , policy_(std::make_shared<const PolicyTable>(cfg.policy))
    , sanitizer_(make_pii_detector())
    , guard_(make_pii_detector(), make_secret_detector())
    , scorer_()
    , invoker_(std::move(client), cfg.global.worker_threads)
    , intake_()
    , rate_limiter_(cfg.rate_limit)
    , audit_(std::move(audit))
    , logger_(std::move(logger))
    , stats_(std::move(stats))
    , settings_(std::make_shared<const RuntimeSettings>(RuntimeSettings::from(cfg)))
{}

std::expected<std::unique_ptr<Pipeline>, GateError> Pipeline::create(
    const GatewayConfig&              cfg,
    std::shared_ptr<ModelClient>      client,
    std::shared_ptr<AuditLogger>      audit,
    std::shared_ptr<StructuredLogger> logger,
    std::shared_ptr<StatsCollector>   stats) {
    if (!client) {
        return std::unexpected(GateError{
            GateErrorCode::kConfigurationError, "model client is null", "pipeline"});
    }
    if (!audit) {
        return std::unexpected(GateError{
            GateErrorCode::kConfigurationError, "audit logger is null", "pipeline"});
    }

    try {
        std::unique_ptr<Pipeline> pipeline(new Pipeline(
            cfg, std::move(client), std::move(audit), std::move(logger), std::move(stats)));
        if (pipeline->detection_degraded()) {
            spdlog::error("[pipeline] injection detection degraded, every request will be blocked");
        }
        spdlog::info("[pipeline] ready: {} injection rules, {} policy rules",
                     pipeline->injection_.rule_count(), pipeline->policy_.rule_count());
        return pipeline;
    } catch (const std::exception& e) {
        return std::unexpected(GateError{
            GateErrorCode::kConfigurationError,
            std::string("pipeline construction failed: ") + e.what(),
            "pipeline"});
    }
}

void Pipeline::update_settings(const GatewayConfig& cfg) {
    settings_.store(std::make_shared<const RuntimeSettings>(RuntimeSettings::from(cfg)));
    spdlog::info("[pipeline] runtime settings updated (pii_mode={}, risk_threshold_block={})",
                 to_string(cfg.sanitizer.pii_mode), cfg.risk.risk_threshold_block);
}

std::shared_ptr<const RuntimeSettings> Pipeline::settings() const {
    return settings_.load();
}

GatewayResponse Pipeline::handle(const RawRequest& raw_in, const CancellationToken& cancel) {
    const auto started  = std::chrono::steady_clock::now();
    const auto settings = settings_.load();

    // 오류 경로에서도 같은 id 가 verdict 와 감사 항목에 남도록 먼저 부여한다.
    RawRequest raw = raw_in;
    if (raw.id.empty()) {
        raw.id = intake_.next_id();
    }

    Outcome outcome;
    try {
        outcome = run(raw, *settings, cancel);
    } catch (const std::exception& e) {
        spdlog::error("[pipeline] request '{}' failed: {}", raw.id, e.what());
        outcome                    = Outcome{};
        outcome.verdict.request_id = raw.id;
        outcome.verdict.decision   = Decision::kBlock;
        outcome.verdict.reason     = DecisionReason::kInternalError;
        outcome.verdict.risk       = scorer_.score(outcome.verdict.injection,
                                                   outcome.verdict.policy,
                                                   outcome.verdict.pii, false);
        outcome.role               = raw.role;
        outcome.block_detail       = e.what();
    }

    try {
        return finalize(std::move(outcome), started);
    } catch (const std::exception& e) {
        spdlog::error("[pipeline] request '{}' could not be finalized: {}", raw.id, e.what());
        return unaudited_block(raw.id);
    }
}

Pipeline::Outcome Pipeline::run(const RawRequest&        raw,
                                const RuntimeSettings&   settings,
                                const CancellationToken& cancel) {
    Outcome out;
    SecurityVerdict& v = out.verdict;
    v.request_id       = raw.id;
    v.reason           = DecisionReason::kNone;
    v.decision         = Decision::kAllow;
    out.role           = raw.role;

    const auto cancelled_here = [&](const char* stage) {
        if (!cancel.cancelled()) {
            return false;
        }
        block(v, DecisionReason::kCancelled);
        out.response_text.reset();
        out.block_detail = std::string("cancelled before ") + stage;
        spdlog::debug("[pipeline] request '{}' cancelled before {}", v.request_id, stage);
        return true;
    };

    // 점수는 모든 종료 경로에서 그 시점까지의 신호로 계산한다.
    const auto rescore = [&](bool response_filtered) {
        v.risk = scorer_.score(v.injection, v.policy, v.pii, response_filtered);
    };

    v.policy = PolicyAction::kBlock;
    if (cancelled_here("intake")) {
        rescore(false);
        return out;
    }

    // 1. Intake
    auto request = intake_.normalize(raw, settings.intake, settings.default_model);
    if (!request) {
        block(v, DecisionReason::kInvalidRequest);
        out.block_detail = request.error().message;
        rescore(false);
        spdlog::debug("[pipeline] request '{}' rejected at intake: {}",
                      v.request_id, request.error().message);
        return out;
    }
    const Request& req = *request;

    // 속도 제한: 탐지기를 돌리기 전에 끊는다.
    if (const auto limited = rate_limiter_.check(req.role, req.caller); !limited.allowed) {
        block(v, DecisionReason::kRateLimited);
        out.block_detail = fmt::format("caller '{}' over rate limit, retry after {}ms",
                                       req.caller, limited.retry_after.count());
        rescore(false);
        spdlog::debug("[pipeline] request '{}' rate limited (role={}, caller={})",
                      v.request_id, req.role, req.caller);
        return out;
    }

    // 2~4. Injection → Intent → Policy (순수 함수, 항상 모두 평가)
    v.injection = injection_.evaluate(req.prompt_text);
    v.intent    = intent_.classify(req.prompt_text);

    const PolicyResult policy = policy_.decide(req.role, v.intent, v.injection);
    v.policy              = policy.action;
    v.matched_policy_rule = policy.matched_rule;

    if (cancelled_here("pii")) {
        rescore(false);
        return out;
    }

    // 5. PII: allow_with_sanitize 는 detect 모드를 mask 로 올린다.
    SanitizeMode mode = settings.pii_mode;
    if (policy.action == PolicyAction::kAllowWithSanitize && mode == SanitizeMode::kDetect) {
        mode = SanitizeMode::kMask;
    }
    const SanitizedText sanitized = sanitizer_.sanitize(req.prompt_text, mode);
    v.pii                = summarize(sanitized);
    out.sanitized_prompt = sanitized.transformed_text;

    rescore(false);

    if (v.injection.degraded) {
        block(v, DecisionReason::kDetectionDegraded);
        out.block_detail = "injection detector has no usable rules";
    } else if (v.injection.is_injection) {
        block(v, DecisionReason::kInjection);
        out.block_detail = v.injection.matched_rule_id
            ? injection_.description_of(*v.injection.matched_rule_id)
            : std::string("injection detected");
    } else if (policy.action == PolicyAction::kBlock) {
        block(v, DecisionReason::kPolicyDenied);
        out.block_detail = policy.reason;
    } else if (v.risk.value >= settings.risk_threshold_block) {
        block(v, DecisionReason::kRiskThreshold);
        out.block_detail = "pre-invocation risk " + std::to_string(v.risk.value) +
                           " reached threshold " + std::to_string(settings.risk_threshold_block);
    }
    if (v.decision == Decision::kBlock) {
        return out;
    }

    if (cancelled_here("model invocation")) {
        return out;
    }

    // 6. Model
    ModelParams params = req.model_params;
    if (const auto cap = policy_.max_tokens_for(req.role)) {
        params.max_tokens = std::min(params.max_tokens, *cap);
    }

    auto completion = invoker_.invoke(out.sanitized_prompt, params, settings.upstream_timeout,
                                      settings.max_attempts, cancel);
    if (!completion) {
        block(v, reason_for(completion.error().code));
        out.block_detail     = completion.error().message;
        out.upstream_failure = completion.error().code != GateErrorCode::kCancelled;
        return out;
    }

    if (cancelled_here("response guard")) {
        return out;
    }

    // 7. ResponseGuard
    GuardResult guarded = guard_.guard(*completion, mode);
    v.response_guard    = guarded.decision;
    v.response_filtered = guarded.leaked;

    // 8. 최종 위험도
    rescore(v.response_filtered);

    if (guarded.leaked) {
        block(v, DecisionReason::kResponseSecretLeak);
        std::string categories;
        for (const auto category : guarded.secret_categories) {
            if (!categories.empty()) {
                categories += ',';
            }
            categories += to_string(category);
        }
        out.block_detail = "secret in model response: " + categories;
        return out;
    }
    if (v.risk.value >= settings.risk_threshold_block) {
        block(v, DecisionReason::kRiskThreshold);
        out.block_detail = "final risk " + std::to_string(v.risk.value) +
                           " reached threshold " + std::to_string(settings.risk_threshold_block);
        return out;
    }

    out.response_text = std::move(guarded.text.transformed_text);
    return out;
}

GatewayResponse Pipeline::finalize(Outcome outcome, std::chrono::steady_clock::time_point started) {
    SecurityVerdict& v = outcome.verdict;
    if (v.decision == Decision::kBlock) {
        outcome.response_text.reset();
    }

    // 9. Audit. 직렬화/기록 중 예외도 기록 실패로 본다.
    std::expected<AuditEntry, GateError> entry = std::unexpected(GateError{
        GateErrorCode::kAuditWriteFailure, "audit append not attempted", "pipeline"});
    try {
        entry = audit_->append(to_json(v), v.request_id);
    } catch (const std::exception& e) {
        entry = std::unexpected(GateError{
            GateErrorCode::kAuditWriteFailure,
            std::string("audit append threw: ") + e.what(), "pipeline"});
    }
    if (entry) {
        v.audited           = true;
        v.audit_sequence_no = entry->sequence_no;
    } else {
        spdlog::error("[pipeline] request '{}' audit append failed: {}",
                      v.request_id, entry.error().message);
        v.decision  = Decision::kBlock;
        v.reason    = DecisionReason::kAuditWriteFailure;
        v.audited   = false;
        v.audit_sequence_no.reset();
        outcome.response_text.reset();
        outcome.block_detail = entry.error().message;
    }

    try {
        observe(outcome, started);
    } catch (const std::exception& e) {
        spdlog::error("[pipeline] request '{}' stats/log recording failed: {}",
                      v.request_id, e.what());
    }

    return GatewayResponse{
        .verdict          = std::move(v),
        .response_text    = std::move(outcome.response_text),
        .sanitized_prompt = std::move(outcome.sanitized_prompt),
    };
}

void Pipeline::observe(const Outcome& outcome, std::chrono::steady_clock::time_point started) {
    const SecurityVerdict& v = outcome.verdict;
    const bool blocked = v.decision == Decision::kBlock;

    if (stats_) {
        stats_->on_request(RequestStats{
            .blocked           = blocked,
            .injection         = blocked && v.reason == DecisionReason::kInjection,
            .rate_limited      = blocked && v.reason == DecisionReason::kRateLimited,
            .pii_detected      = v.pii.detected,
            .high_risk         = v.risk.band == RiskBand::kHigh,
            .response_filtered = v.response_filtered,
            .upstream_failure  = outcome.upstream_failure,
        });
    }

    if (logger_) {
        const auto now = std::chrono::system_clock::now();

        std::vector<std::string> types;
        types.reserve(v.pii.types.size());
        for (const auto category : v.pii.types) {
            types.emplace_back(to_string(category));
        }

        logger_->log_verdict(VerdictLog{
            .request_id           = v.request_id,
            .role                 = outcome.role,
            .decision             = std::string(to_string(v.decision)),
            .reason               = std::string(to_string(v.reason)),
            .risk_score           = v.risk.value,
            .risk_band            = std::string(to_string(v.risk.band)),
            .intent               = std::string(to_string(v.intent)),
            .policy               = std::string(to_string(v.policy)),
            .pii_count            = v.pii.count,
            .pii_types            = std::move(types),
            .is_injection         = v.injection.is_injection,
            .injection_confidence = v.injection.confidence,
            .response_filtered    = v.response_filtered,
            .audited              = v.audited,
            .audit_sequence_no    = v.audit_sequence_no,
            .timestamp            = now,
            .duration             = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - started),
        });

        if (blocked) {
            logger_->log_block(BlockLog{
                .request_id   = v.request_id,
                .role         = outcome.role,
                .reason       = std::string(to_string(v.reason)),
                .matched_rule = v.matched_policy_rule,
                .detail       = outcome.block_detail,
                .timestamp    = now,
            });
        }
    }
}
