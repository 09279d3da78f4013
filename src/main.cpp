#include "gateway/gateway_server.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없거나 비어 있으면 nullopt)
// ---------------------------------------------------------------------------
namespace {

std::optional<std::string> env_str(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return std::string(val);
    }
    return std::nullopt;
}

std::optional<std::uint16_t> env_u16(const char* name) {
    const auto val = env_str(name);
    if (!val) {
        return std::nullopt;
    }
    unsigned parsed = 0;
    const std::string_view sv{*val};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), parsed);
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || parsed < 1 || parsed > 65535) {
        spdlog::warn("env {}: invalid value '{}', using configured value", name, *val);
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(parsed);
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 설정 경로 + 환경변수 오버라이드 ─────────────────────────────────
    GatewayServerOptions options;
    options.config_path     = env_str("PROMPTGATE_CONFIG").value_or("config/gateway.yaml");
    options.uds_socket_path = env_str("UDS_SOCKET_PATH");
    options.log_path        = env_str("LOG_PATH");
    options.log_level       = env_str("LOG_LEVEL");
    options.audit_path      = env_str("AUDIT_PATH");
    options.upstream_host   = env_str("UPSTREAM_HOST");
    options.upstream_port   = env_u16("UPSTREAM_PORT");

    spdlog::info("Starting promptgate");
    spdlog::info("Config: {}", options.config_path.string());

    // ── GatewayServer 생성 및 실행 ──────────────────────────────────────
    boost::asio::io_context ioc;
    GatewayServer server{options};

    auto started = server.start(ioc);
    if (!started) {
        spdlog::critical("promptgate failed to start: {}", started.error());
        return EXIT_FAILURE;
    }
    ioc.run();

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("promptgate stopped");

    return EXIT_SUCCESS;
}
