#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "audit/audit_logger.hpp"
#include "gateway/pipeline.hpp"
#include "logger/structured_logger.hpp"
#include "policy/rule.hpp"
#include "stats/stats_collector.hpp"
#include "stats/uds_server.hpp"

// ---------------------------------------------------------------------------
// GatewayServerOptions
//   데몬 기동 옵션. config_path 외의 값은 환경변수에서 온 오버라이드이며,
//   설정되면 YAML 의 같은 항목보다 우선한다.
//
//   config_path     : 게이트웨이 설정 파일 (YAML)
//   uds_socket_path : 제어 소켓 경로
//   log_path        : 구조화 로그 파일 경로
//   log_level       : "debug" | "info" | "warn" | "error"
//   audit_path      : 감사 체인 JSONL 경로
//   upstream_host   : 모델 백엔드 호스트
//   upstream_port   : 모델 백엔드 포트
// ---------------------------------------------------------------------------
struct GatewayServerOptions {
    std::filesystem::path        config_path{"config/gateway.yaml"};
    std::optional<std::string>   uds_socket_path{};
    std::optional<std::string>   log_path{};
    std::optional<std::string>   log_level{};
    std::optional<std::string>   audit_path{};
    std::optional<std::string>   upstream_host{};
    std::optional<std::uint16_t> upstream_port{};
};

// ---------------------------------------------------------------------------
// GatewayServer
//   설정 로드 → 감사 체인 복구 → 파이프라인 구성 → 제어 소켓 → 시그널 처리.
//
//   사용 예:
//     GatewayServer server(options);
//     if (auto started = server.start(ioc); !started) { ... exit(1) ... }
//     ioc.run();
//
//   [fail-close]
//   start() 실패(설정 오류, 감사 체인 검증 실패)는 ConfigurationError 로 보고
//   데몬은 요청을 받기 전에 종료한다.
//
//   [시그널]
//   SIGTERM / SIGINT → stop()
//   SIGHUP           → reload() (런타임 설정만 교체, 실패 시 기존 설정 유지)
// ---------------------------------------------------------------------------
class GatewayServer {
public:
    explicit GatewayServer(GatewayServerOptions options);

    ~GatewayServer() = default;

    GatewayServer(const GatewayServer&)            = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;
    GatewayServer(GatewayServer&&)                 = delete;
    GatewayServer& operator=(GatewayServer&&)      = delete;

    [[nodiscard]] std::expected<void, std::string> start(boost::asio::io_context& io_ctx);

    void stop();

    // reload
    //   설정 파일을 다시 읽어 파이프라인 런타임 설정을 교체한다.
    //   SIGHUP 과 제어 소켓 "reload" 커맨드가 공유한다.
    [[nodiscard]] std::expected<void, std::string> reload();

    // apply_overrides
    //   환경변수 오버라이드를 설정에 반영한다.
    static void apply_overrides(GatewayConfig& cfg, const GatewayServerOptions& options);

private:
    void wait_for_stop_signal();
    void wait_for_hup();

    GatewayServerOptions options_;
    bool                 stopping_{false};

    std::shared_ptr<StructuredLogger> logger_{};
    std::shared_ptr<StatsCollector>   stats_{};
    std::shared_ptr<AuditLogger>      audit_{};
    std::shared_ptr<Pipeline>         pipeline_{};
    std::unique_ptr<UdsServer>        uds_server_{};

    std::unique_ptr<boost::asio::signal_set> signals_stop_{};
    std::unique_ptr<boost::asio::signal_set> signals_hup_{};

    boost::asio::io_context* io_ctx_{nullptr};
};
