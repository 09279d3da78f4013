// ---------------------------------------------------------------------------
// test_model_invoker.cpp
//
// ModelInvoker / HttpModelClient 단위 테스트.
//
// [테스트 범위]
// - 정상 응답 전달, 파라미터 전달
// - kUpstreamUnavailable 만 재시도, max_attempts 초과 시 마지막 오류
// - 시도 단위 타임아웃 → kUpstreamTimeout, 재시도 없음
// - 클라이언트에 시도 기한 전달, 클라이언트가 보고한 타임아웃도 재시도 없음
// - 포기한 뒤 큐에서 꺼내진 작업은 백엔드를 호출하지 않음
// - 대기 중 취소 → kCancelled
// - nullptr 클라이언트 → std::invalid_argument
// - HttpModelClient: 요청 본문 형식, 응답 텍스트 추출,
//   루프백 HTTP 서버와 실제 왕복, 닫힌 포트 → kUpstreamUnavailable,
//   호출 기한 초과 → kUpstreamTimeout, 응답 본문 상한 초과 → kUpstreamUnavailable
//
// [알려진 한계]
// 타이밍 기반 테스트는 지연을 타임아웃의 수 배로 두어 여유를 확보한다.
// ---------------------------------------------------------------------------

#include "upstream/http_model_client.hpp"
#include "upstream/model_invoker.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "fake_model_client.hpp"

using namespace std::chrono_literals;

namespace {

ModelParams params_for(std::string model) {
    ModelParams p{};
    p.model       = std::move(model);
    p.max_tokens  = 128;
    p.temperature = 0.2;
    return p;
}

} // namespace

// ===========================================================================
// 1. ModelInvoker
// ===========================================================================

TEST(ModelInvoker, Success_ReturnsResponseAndForwardsParams) {
    auto client = std::make_shared<FakeModelClient>("hello back");
    const ModelInvoker invoker(client, 2);

    const auto result = invoker.invoke("hello", params_for("m-1"), 1000ms, 1, CancellationToken{});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, "hello back");
    EXPECT_EQ(client->calls(), 1);
    EXPECT_EQ(client->last_prompt(), "hello");
    EXPECT_EQ(client->last_params().model, "m-1");
    EXPECT_EQ(client->last_params().max_tokens, 128u);
}

TEST(ModelInvoker, Unavailable_RetriedUntilSuccess) {
    auto client = std::make_shared<FakeModelClient>();
    client->fail_with(GateErrorCode::kUpstreamUnavailable, 2);
    const ModelInvoker invoker(client, 1);

    const auto result = invoker.invoke("hi", ModelParams{}, 1000ms, 3, CancellationToken{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(client->calls(), 3);
}

TEST(ModelInvoker, Unavailable_AttemptsExhausted) {
    auto client = std::make_shared<FakeModelClient>();
    client->fail_with(GateErrorCode::kUpstreamUnavailable);
    const ModelInvoker invoker(client, 1);

    const auto result = invoker.invoke("hi", ModelParams{}, 1000ms, 2, CancellationToken{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kUpstreamUnavailable);
    EXPECT_EQ(client->calls(), 2);
}

TEST(ModelInvoker, ZeroAttempts_TreatedAsOne) {
    auto client = std::make_shared<FakeModelClient>();
    client->fail_with(GateErrorCode::kUpstreamUnavailable);
    const ModelInvoker invoker(client, 1);

    const auto result = invoker.invoke("hi", ModelParams{}, 1000ms, 0, CancellationToken{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(client->calls(), 1);
}

TEST(ModelInvoker, OtherErrors_NotRetried) {
    auto client = std::make_shared<FakeModelClient>();
    client->fail_with(GateErrorCode::kInternalError);
    const ModelInvoker invoker(client, 1);

    const auto result = invoker.invoke("hi", ModelParams{}, 1000ms, 3, CancellationToken{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kInternalError);
    EXPECT_EQ(client->calls(), 1);
}

TEST(ModelInvoker, SlowBackend_TimesOutWithoutRetry) {
    auto client = std::make_shared<FakeModelClient>();
    client->set_delay(300ms);
    const ModelInvoker invoker(client, 2);

    const auto start  = std::chrono::steady_clock::now();
    const auto result = invoker.invoke("hi", ModelParams{}, 50ms, 3, CancellationToken{});
    const auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kUpstreamTimeout);
    EXPECT_LT(waited, 250ms);
    EXPECT_EQ(client->calls(), 1);
}

TEST(ModelInvoker, AttemptTimeout_PassedToClient) {
    auto client = std::make_shared<FakeModelClient>();
    const ModelInvoker invoker(client, 1);

    ASSERT_TRUE(invoker.invoke("hi", ModelParams{}, 750ms, 1, CancellationToken{}).has_value());
    EXPECT_EQ(client->last_timeout(), 750ms);

    ASSERT_TRUE(invoker.invoke("hi", ModelParams{}, 120ms, 1, CancellationToken{}).has_value());
    EXPECT_EQ(client->last_timeout(), 120ms);
}

TEST(ModelInvoker, ClientReportedTimeout_NotRetried) {
    auto client = std::make_shared<FakeModelClient>();
    client->fail_with(GateErrorCode::kUpstreamTimeout);
    const ModelInvoker invoker(client, 1);

    const auto result = invoker.invoke("hi", ModelParams{}, 1000ms, 3, CancellationToken{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kUpstreamTimeout);
    EXPECT_EQ(client->calls(), 1);
}

// 워커 하나가 느린 호출에 묶인 동안 큐에 들어간 두 번째 호출은 기한이 지나면
// 포기되고, 나중에 워커가 비어도 백엔드로 나가지 않는다.
TEST(ModelInvoker, AbandonedQueuedCall_NeverReachesBackend) {
    auto client = std::make_shared<FakeModelClient>();
    client->set_delay(300ms);
    {
        const ModelInvoker invoker(client, 1);

        const auto first = invoker.invoke("one", ModelParams{}, 50ms, 1, CancellationToken{});
        ASSERT_FALSE(first.has_value());
        EXPECT_EQ(first.error().code, GateErrorCode::kUpstreamTimeout);

        const auto second = invoker.invoke("two", ModelParams{}, 50ms, 1, CancellationToken{});
        ASSERT_FALSE(second.has_value());
        EXPECT_EQ(second.error().code, GateErrorCode::kUpstreamTimeout);
    }  // 소멸자가 워커 풀을 join 한다

    EXPECT_EQ(client->calls(), 1);
    EXPECT_EQ(client->last_prompt(), "one");
}

TEST(ModelInvoker, CancelledWhileWaiting) {
    auto client = std::make_shared<FakeModelClient>();
    client->set_delay(300ms);
    const ModelInvoker invoker(client, 1);

    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });

    const auto result = invoker.invoke("hi", ModelParams{}, 2000ms, 1, token);
    canceller.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kCancelled);
}

TEST(ModelInvoker, AlreadyCancelled_NoWait) {
    auto client = std::make_shared<FakeModelClient>();
    const ModelInvoker invoker(client, 1);

    CancellationToken token;
    token.cancel();
    const auto result = invoker.invoke("hi", ModelParams{}, 1000ms, 1, token);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kCancelled);
}

TEST(ModelInvoker, NullClient_Throws) {
    EXPECT_THROW({ const ModelInvoker invoker(nullptr, 1); }, std::invalid_argument);
}

// ===========================================================================
// 2. HttpModelClient
// ===========================================================================

TEST(HttpModelClient, BuildRequestBody_EscapedJson) {
    const auto body = HttpModelClient::build_request_body("say \"hi\"\n", params_for("m-1"));
    EXPECT_EQ(body,
              R"({"model":"m-1","prompt":"say \"hi\"\n","max_tokens":128,"temperature":0.20})");
}

TEST(HttpModelClient, ExtractCompletion_TextThenContent) {
    EXPECT_EQ(HttpModelClient::extract_completion(R"({"choices":[{"text":"a\nb"}]})").value_or(""),
              "a\nb");
    EXPECT_EQ(HttpModelClient::extract_completion(
                  R"({"choices":[{"message":{"role":"assistant","content":"hey"}}]})")
                  .value_or(""),
              "hey");
    EXPECT_FALSE(HttpModelClient::extract_completion(R"({"error":"overloaded"})").has_value());
}

// 요청 한 건을 받아 고정 응답을 돌려주는 루프백 HTTP 서버
class LoopbackBackend {
public:
    LoopbackBackend(unsigned status, std::string body,
                    std::chrono::milliseconds delay = 0ms)
        : acceptor_{ioc_, {boost::asio::ip::make_address("127.0.0.1"), 0}}
        , port_{acceptor_.local_endpoint().port()}
        , thread_{[this, status, body = std::move(body), delay]() { serve(status, body, delay); }}
    {}

    ~LoopbackBackend() {
        join();
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] const std::string& received_body() const noexcept { return received_body_; }
    [[nodiscard]] const std::string& received_target() const noexcept { return received_target_; }

private:
    // 클라이언트가 먼저 끊을 수 있으므로 모든 단계를 error_code 로 받는다.
    void serve(unsigned status, const std::string& body, std::chrono::milliseconds delay) {
        namespace http = boost::beast::http;

        boost::system::error_code    ec;
        boost::asio::ip::tcp::socket socket{ioc_};
        acceptor_.accept(socket, ec);
        if (ec) { return; }

        boost::beast::flat_buffer         buffer;
        http::request<http::string_body>  req;
        http::read(socket, buffer, req, ec);
        if (ec) { return; }
        received_body_   = req.body();
        received_target_ = std::string(req.target());

        if (delay > 0ms) {
            std::this_thread::sleep_for(delay);
        }

        http::response<http::string_body> res{static_cast<http::status>(status), 11};
        res.set(http::field::content_type, "application/json");
        res.body() = body;
        res.prepare_payload();
        http::write(socket, res, ec);

        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }

    boost::asio::io_context        ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::uint16_t                  port_;
    std::string                    received_body_;
    std::string                    received_target_;
    std::thread                    thread_;
};

TEST(HttpModelClient, RoundTrip_Loopback) {
    auto backend = std::make_unique<LoopbackBackend>(200, R"({"choices":[{"text":"pong"}]})");

    HttpModelClient client{HttpModelClientConfig{
        .host    = "127.0.0.1",
        .port    = backend->port(),
        .target  = "/v1/completions",
    }};
    const auto result = client.complete("ping", params_for("m-1"), 2000ms);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, "pong");

    // 서버 스레드가 끝난 뒤 수신 내용을 확인한다
    const std::string expected_body = HttpModelClient::build_request_body("ping", params_for("m-1"));
    backend->join();
    EXPECT_EQ(backend->received_target(), "/v1/completions");
    EXPECT_EQ(backend->received_body(), expected_body);
}

TEST(HttpModelClient, Non2xx_Unavailable) {
    LoopbackBackend backend(503, R"({"text":"busy"})");

    HttpModelClient client{HttpModelClientConfig{
        .host    = "127.0.0.1",
        .port    = backend.port(),
        .target  = "/v1/completions",
    }};
    const auto result = client.complete("ping", ModelParams{}, 2000ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kUpstreamUnavailable);
    EXPECT_NE(result.error().message.find("503"), std::string::npos) << result.error().message;
}

TEST(HttpModelClient, ClosedPort_Unavailable) {
    std::uint16_t port = 0;
    {
        boost::asio::io_context        ioc;
        boost::asio::ip::tcp::acceptor reserved{ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}};
        port = reserved.local_endpoint().port();
    }

    HttpModelClient client{HttpModelClientConfig{
        .host    = "127.0.0.1",
        .port    = port,
        .target  = "/v1/completions",
    }};
    const auto result = client.complete("ping", ModelParams{}, 2000ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kUpstreamUnavailable);
}

TEST(HttpModelClient, SlowBackend_UpstreamTimeout) {
    LoopbackBackend backend(200, R"({"text":"late"})", 600ms);

    HttpModelClient client{HttpModelClientConfig{
        .host   = "127.0.0.1",
        .port   = backend.port(),
        .target = "/v1/completions",
    }};
    const auto start  = std::chrono::steady_clock::now();
    const auto result = client.complete("ping", ModelParams{}, 100ms);
    const auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kUpstreamTimeout);
    EXPECT_LT(waited, 500ms);
}

TEST(HttpModelClient, OversizedResponse_Unavailable) {
    LoopbackBackend backend(200, R"({"text":")" + std::string(4096, 'x') + R"("})");

    HttpModelClient client{HttpModelClientConfig{
        .host               = "127.0.0.1",
        .port               = backend.port(),
        .target             = "/v1/completions",
        .max_response_bytes = 1024,
    }};
    const auto result = client.complete("ping", ModelParams{}, 2000ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GateErrorCode::kUpstreamUnavailable);
    EXPECT_NE(result.error().message.find("exceeds 1024 bytes"), std::string::npos)
        << result.error().message;
}
