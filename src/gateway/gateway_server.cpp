#include "gateway/gateway_server.hpp"

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include "policy/policy_loader.hpp"
#include "upstream/http_model_client.hpp"

namespace {

spdlog::level::level_enum to_spdlog_level(std::string_view name) {
    switch (parse_log_level(name)) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
        case LogLevel::kInfo:  break;
    }
    return spdlog::level::info;
}

}  // namespace

// ---------------------------------------------------------------------------
// GatewayServer 구현
//
// start() 흐름:
//   1. PolicyLoader::load(config_path) + 환경변수 오버라이드
//   2. StructuredLogger, StatsCollector 생성
//   3. AuditLogger 생성 + restore() (체인 검증 실패는 기동 실패)
//   4. HttpModelClient + Pipeline::create
//   5. UdsServer + co_spawn(run)
//   6. SIGTERM/SIGINT 핸들러 + SIGHUP 핸들러
// ---------------------------------------------------------------------------

GatewayServer::GatewayServer(GatewayServerOptions options)
    : options_{std::move(options)}
{}

void GatewayServer::apply_overrides(GatewayConfig& cfg, const GatewayServerOptions& options) {
    if (options.uds_socket_path) { cfg.global.uds_socket_path = *options.uds_socket_path; }
    if (options.log_path)        { cfg.global.log_path        = *options.log_path; }
    if (options.log_level)       { cfg.global.log_level       = *options.log_level; }
    if (options.audit_path)      { cfg.global.audit_path      = *options.audit_path; }
    if (options.upstream_host)   { cfg.upstream.host          = *options.upstream_host; }
    if (options.upstream_port)   { cfg.upstream.port          = *options.upstream_port; }
}

std::expected<void, std::string> GatewayServer::reload() {
    spdlog::info("[gateway] reloading configuration: {}", options_.config_path.string());

    if (!pipeline_) {
        return std::unexpected(std::string("gateway not started"));
    }

    auto result = PolicyLoader::load(options_.config_path);
    if (!result) {
        spdlog::warn("[gateway] reload failed (keeping current settings): {}", result.error());
        return std::unexpected(result.error());
    }
    apply_overrides(*result, options_);

    pipeline_->update_settings(*result);
    spdlog::set_level(to_spdlog_level(result->global.log_level));
    spdlog::info("[gateway] configuration reloaded");
    return {};
}

std::expected<void, std::string> GatewayServer::start(boost::asio::io_context& io_ctx) {
    io_ctx_ = &io_ctx;

    // -----------------------------------------------------------------------
    // 1. 설정 로드 (실패 = ConfigurationError, 기동 중단)
    // -----------------------------------------------------------------------
    auto load_result = PolicyLoader::load(options_.config_path);
    if (!load_result) {
        return std::unexpected("configuration error: " + load_result.error());
    }
    GatewayConfig cfg = std::move(*load_result);
    apply_overrides(cfg, options_);
    spdlog::set_level(to_spdlog_level(cfg.global.log_level));

    // -----------------------------------------------------------------------
    // 2. logger, stats
    // -----------------------------------------------------------------------
    try {
        logger_ = std::make_shared<StructuredLogger>(parse_log_level(cfg.global.log_level),
                                                     cfg.global.log_path);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("logger initialization failed: ") + e.what());
    }
    stats_ = std::make_shared<StatsCollector>();

    // -----------------------------------------------------------------------
    // 3. 감사 체인 복구
    // -----------------------------------------------------------------------
    audit_ = std::make_shared<AuditLogger>(cfg.global.audit_path);
    auto restored = audit_->restore();
    if (!restored) {
        return std::unexpected("configuration error: " + restored.error().message);
    }
    spdlog::info("[gateway] audit chain restored: {} entries from {}",
                 *restored, cfg.global.audit_path);

    // -----------------------------------------------------------------------
    // 4. 파이프라인
    // -----------------------------------------------------------------------
    auto client = std::make_shared<HttpModelClient>(HttpModelClientConfig{
        .host               = cfg.upstream.host,
        .port               = cfg.upstream.port,
        .target             = cfg.upstream.target,
        .max_response_bytes = cfg.upstream.max_response_bytes,
    });

    auto pipeline = Pipeline::create(cfg, std::move(client), audit_, logger_, stats_);
    if (!pipeline) {
        return std::unexpected("configuration error: " + pipeline.error().message);
    }
    pipeline_ = std::move(*pipeline);

    // -----------------------------------------------------------------------
    // 5. UdsServer 생성 + co_spawn
    // -----------------------------------------------------------------------
    uds_server_ = std::make_unique<UdsServer>(
        cfg.global.uds_socket_path,
        stats_,
        pipeline_,
        [this]() { return reload(); },
        io_ctx,
        cfg.global.worker_threads
    );

    boost::asio::co_spawn(
        io_ctx,
        uds_server_->run(),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[gateway] uds_server error: {}", e.what());
                }
            }
        }
    );

    // -----------------------------------------------------------------------
    // 6. 시그널 핸들러
    // -----------------------------------------------------------------------
    signals_stop_ = std::make_unique<boost::asio::signal_set>(io_ctx, SIGTERM, SIGINT);
    signals_hup_  = std::make_unique<boost::asio::signal_set>(io_ctx, SIGHUP);
    wait_for_stop_signal();
    wait_for_hup();

    spdlog::info("[gateway] started (upstream {}:{}{}, pii_mode={}, risk_threshold_block={})",
                 cfg.upstream.host, cfg.upstream.port, cfg.upstream.target,
                 to_string(cfg.sanitizer.pii_mode), cfg.risk.risk_threshold_block);
    return {};
}

void GatewayServer::wait_for_stop_signal() {
    signals_stop_->async_wait([this](const boost::system::error_code& ec, int signum) {
        if (!ec) {
            spdlog::info("[gateway] shutdown signal {} received", signum);
            stop();
        }
    });
}

// SIGHUP 은 수신 후 재등록하여 반복 감지한다.
void GatewayServer::wait_for_hup() {
    signals_hup_->async_wait([this](const boost::system::error_code& ec, int /*signum*/) {
        if (ec) {
            return;
        }
        auto reloaded = reload();
        if (!reloaded) {
            spdlog::warn("[gateway] SIGHUP reload failed: {}", reloaded.error());
        }
        if (!stopping_) {
            wait_for_hup();
        }
    });
}

// ---------------------------------------------------------------------------
// stop
//   제어 소켓을 닫고 시그널 대기를 취소한 뒤 io_context 를 중단한다.
//   진행 중인 inspect 요청은 UdsServer 소멸 시 worker 풀 join 으로 끝까지 처리된다.
// ---------------------------------------------------------------------------
void GatewayServer::stop() {
    if (stopping_) {
        return;
    }
    stopping_ = true;

    spdlog::info("[gateway] stopping");

    if (uds_server_) {
        uds_server_->stop();
    }

    for (auto* signals : {signals_stop_.get(), signals_hup_.get()}) {
        if (signals == nullptr) {
            continue;
        }
        boost::system::error_code ec;
        signals->cancel(ec);
        if (ec) {
            spdlog::warn("[gateway] signal cancel error: {}", ec.message());
        }
    }

    // acceptor 정리(UdsServer::stop 이 post 한 작업) 뒤에 io_context 를 멈춘다.
    if (io_ctx_ != nullptr) {
        boost::asio::post(*io_ctx_, [ctx = io_ctx_]() { ctx->stop(); });
    }
}
