// ---------------------------------------------------------------------------
// test_gateway_server.cpp
//
// GatewayServer 기동/종료/리로드 테스트.
//
// [테스트 범위]
// - apply_overrides: 설정된 환경변수 오버라이드만 반영
// - start(): 설정 파일 없음 → configuration error
// - start(): 변조된 감사 파일 → 기동 실패 (fail-close)
// - start() → reload() 성공 / 잘못된 설정으로 reload 실패 → stop() 으로 run() 종료
// - 기동 전 reload() → 오류
//
// [알려진 한계]
// 시그널 처리 경로(SIGTERM/SIGHUP)는 프로세스 전역 상태를 건드리므로 여기서
// 직접 시그널을 보내지 않는다. stop()/reload() 를 직접 호출해 같은 경로를 검증한다.
// ---------------------------------------------------------------------------

#include "gateway/gateway_server.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class GatewayServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        dir_ = fs::temp_directory_path() /
               ("promptgate_gw_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter.fetch_add(1)));
        fs::create_directories(dir_);
        config_path_ = dir_ / "gateway.yaml";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write_config(const std::string& pii_mode) const {
        std::ofstream out(config_path_, std::ios::trunc);
        out << "global:\n"
            << "  log_level: warn\n"
            << "  log_path: " << (dir_ / "gateway.log").string() << "\n"
            << "  audit_path: " << (dir_ / "audit.jsonl").string() << "\n"
            << "  uds_socket_path: " << (dir_ / "gw.sock").string() << "\n"
            << "  worker_threads: 1\n"
            << "sanitizer:\n"
            << "  pii_mode: " << pii_mode << "\n"
            << "upstream:\n"
            << "  host: 127.0.0.1\n"
            << "  port: 9\n"
            << "  timeout_ms: 200\n"
            << "  max_attempts: 1\n"
            << "role_table:\n"
            << "  user: [chat]\n";
    }

    [[nodiscard]] GatewayServerOptions options() const {
        GatewayServerOptions opts;
        opts.config_path = config_path_;
        return opts;
    }

    fs::path dir_;
    fs::path config_path_;
};

} // namespace

TEST(GatewayServerOverrides, OnlySetValuesApplied) {
    GatewayConfig cfg{};
    cfg.global.log_path = "/var/log/original.log";

    GatewayServerOptions options;
    options.uds_socket_path = "/run/pg.sock";
    options.audit_path      = "/var/lib/pg/audit.jsonl";
    options.upstream_host   = "model.local";
    options.upstream_port   = 7000;

    GatewayServer::apply_overrides(cfg, options);

    EXPECT_EQ(cfg.global.uds_socket_path, "/run/pg.sock");
    EXPECT_EQ(cfg.global.audit_path, "/var/lib/pg/audit.jsonl");
    EXPECT_EQ(cfg.upstream.host, "model.local");
    EXPECT_EQ(cfg.upstream.port, 7000);
    EXPECT_EQ(cfg.global.log_path, "/var/log/original.log");
    EXPECT_EQ(cfg.global.log_level, "info");
}

TEST_F(GatewayServerTest, Start_MissingConfig_Fails) {
    GatewayServerOptions opts;
    opts.config_path = dir_ / "does_not_exist.yaml";

    boost::asio::io_context ioc;
    GatewayServer server{opts};
    const auto started = server.start(ioc);
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().rfind("configuration error", 0), 0u) << started.error();
}

TEST_F(GatewayServerTest, Reload_BeforeStart_Fails) {
    write_config("mask");
    GatewayServer server{options()};
    const auto reloaded = server.reload();
    ASSERT_FALSE(reloaded.has_value());
    EXPECT_EQ(reloaded.error(), "gateway not started");
}

TEST_F(GatewayServerTest, Start_TamperedAuditFile_Fails) {
    write_config("mask");
    {
        std::ofstream out(dir_ / "audit.jsonl");
        out << "this is not an audit record\n";
    }

    boost::asio::io_context ioc;
    GatewayServer server{options()};
    const auto started = server.start(ioc);
    ASSERT_FALSE(started.has_value());
    EXPECT_NE(started.error().find("malformed audit record"), std::string::npos) << started.error();
}

TEST_F(GatewayServerTest, StartReloadStop) {
    write_config("mask");

    boost::asio::io_context ioc;
    GatewayServer server{options()};
    const auto started = server.start(ioc);
    ASSERT_TRUE(started.has_value()) << started.error();

    std::thread runner([&ioc]() { ioc.run(); });

    // 유효한 설정 변경은 반영된다
    write_config("redact");
    const auto reloaded = server.reload();
    EXPECT_TRUE(reloaded.has_value()) << reloaded.error();

    // 잘못된 설정은 거부되고 기존 설정이 유지된다
    write_config("scramble");
    const auto rejected = server.reload();
    ASSERT_FALSE(rejected.has_value());
    EXPECT_NE(rejected.error().find("pii_mode"), std::string::npos) << rejected.error();

    boost::asio::post(ioc, [&server]() { server.stop(); });
    runner.join();
    EXPECT_TRUE(ioc.stopped());
}
