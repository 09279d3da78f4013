#include "upstream/http_model_client.hpp"

#include <exception>
#include <optional>
#include <string_view>

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/json_util.hpp"

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

namespace {

GateError unavailable(std::string message) {
    return GateError{GateErrorCode::kUpstreamUnavailable, std::move(message), "http_model_client"};
}

// transport_error
//   tcp_stream 기한 초과는 timeout, 나머지 전송 오류는 unavailable.
GateError transport_error(std::string_view stage, const beast::error_code& ec,
                          std::chrono::milliseconds timeout) {
    if (ec == beast::error::timeout) {
        return GateError{GateErrorCode::kUpstreamTimeout,
                         fmt::format("{} timed out after {} ms", stage, timeout.count()),
                         "http_model_client"};
    }
    return unavailable(fmt::format("{} failed: {}", stage, ec.message()));
}

// ---------------------------------------------------------------------------
// do_request
//   resolve → connect → write → read 를 하나의 코루틴으로 수행한다.
//   tcp_stream::expires_after 로 호출 기한을 연결부터 읽기까지 한 번에 건다.
// ---------------------------------------------------------------------------
asio::awaitable<std::expected<std::string, GateError>> do_request(
    const HttpModelClientConfig& cfg, std::string body, std::chrono::milliseconds timeout) {
    auto executor = co_await asio::this_coro::executor;

    boost::system::error_code ec;
    tcp::resolver resolver{executor};
    const auto endpoints = co_await resolver.async_resolve(
        cfg.host, std::to_string(cfg.port),
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(unavailable(fmt::format("resolve failed: {}", ec.message())));
    }

    beast::tcp_stream stream{executor};
    stream.expires_after(timeout);
    co_await stream.async_connect(endpoints, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(transport_error("connect", ec, timeout));
    }

    http::request<http::string_body> req{http::verb::post, cfg.target, 11};
    req.set(http::field::host, cfg.host);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::user_agent, "promptgate");
    req.body() = std::move(body);
    req.prepare_payload();

    co_await http::async_write(stream, req, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(transport_error("write", ec, timeout));
    }

    beast::flat_buffer                        buffer;
    http::response_parser<http::string_body>  parser;
    parser.body_limit(cfg.max_response_bytes);
    co_await http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
    if (ec == http::error::body_limit) {
        co_return std::unexpected(unavailable(fmt::format(
            "backend response exceeds {} bytes", cfg.max_response_bytes)));
    }
    if (ec) {
        co_return std::unexpected(transport_error("read", ec, timeout));
    }
    const auto res = parser.release();

    // 종료 실패는 응답 처리에 영향을 주지 않는다.
    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
        spdlog::debug("http_model_client: shutdown: {}", shutdown_ec.message());
    }

    const auto status = res.result_int();
    if (status < 200 || status >= 300) {
        co_return std::unexpected(unavailable(fmt::format("backend returned HTTP {}", status)));
    }

    auto text = HttpModelClient::extract_completion(res.body());
    if (!text) {
        co_return std::unexpected(unavailable("backend response has no completion text"));
    }
    co_return std::move(*text);
}

}  // namespace

HttpModelClient::HttpModelClient(HttpModelClientConfig config)
    : config_{std::move(config)}
{}

std::string HttpModelClient::build_request_body(const std::string& prompt,
                                                const ModelParams& params) {
    return fmt::format(R"({{"model":{},"prompt":{},"max_tokens":{},"temperature":{:.2f}}})",
                       json_quote(params.model),
                       json_quote(prompt),
                       params.max_tokens,
                       params.temperature);
}

std::optional<std::string> HttpModelClient::extract_completion(const std::string& body) {
    if (auto text = find_string_field(body, "text")) {
        return text;
    }
    return find_string_field(body, "content");
}

std::expected<std::string, GateError> HttpModelClient::complete(const std::string&        prompt,
                                                                const ModelParams&        params,
                                                                std::chrono::milliseconds timeout) {
    asio::io_context ioc;

    std::optional<std::expected<std::string, GateError>> outcome;
    asio::co_spawn(
        ioc,
        do_request(config_, build_request_body(prompt, params), timeout),
        [&outcome](std::exception_ptr ep, std::expected<std::string, GateError> result) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    outcome = std::unexpected(unavailable(
                        fmt::format("request aborted: {}", e.what())));
                    return;
                }
            }
            outcome = std::move(result);
        });

    ioc.run();

    if (!outcome) {
        return std::unexpected(unavailable("request did not complete"));
    }
    if (!outcome->has_value()) {
        spdlog::warn("http_model_client: request to {}:{}{} failed: {}",
                     config_.host, config_.port, config_.target, outcome->error().message);
    }
    return std::move(*outcome);
}
