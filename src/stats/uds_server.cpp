// ---------------------------------------------------------------------------
// uds_server.cpp
//
// UdsServer 구현. Unix Domain Socket 제어 서버.
//
// [프로토콜]
//   요청/응답 모두 4byte LE 길이 프리픽스 + JSON 바디.
//
// [지원 커맨드]
//   "stats", "inspect", "audit_verify", "audit_export", "reload"
//   기타: error 응답
// ---------------------------------------------------------------------------

#include "stats/uds_server.hpp"

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>
#include <string_view>
#include <vector>

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/json_util.hpp"

namespace {

// ---------------------------------------------------------------------------
// make_ok_response
//   {"ok":true,"payload":<data>}
// ---------------------------------------------------------------------------
std::string make_ok_response(std::string_view data) {
    return fmt::format(R"({{"ok":true,"payload":{}}})", data);
}

// ---------------------------------------------------------------------------
// make_error_response
//   {"ok":false,"error":"<msg>"}
// ---------------------------------------------------------------------------
std::string make_error_response(std::string_view msg) {
    return fmt::format(R"({{"ok":false,"error":{}}})", json_quote(msg));
}

std::array<std::uint8_t, 4> encode_le4(std::uint32_t val) {
    return {
        static_cast<std::uint8_t>(val),
        static_cast<std::uint8_t>(val >> 8),
        static_cast<std::uint8_t>(val >> 16),
        static_cast<std::uint8_t>(val >> 24),
    };
}

std::uint32_t decode_le4(const std::array<std::uint8_t, 4>& buf) {
    return static_cast<std::uint32_t>(buf[0])
         | (static_cast<std::uint32_t>(buf[1]) << 8)
         | (static_cast<std::uint32_t>(buf[2]) << 16)
         | (static_cast<std::uint32_t>(buf[3]) << 24);
}

std::string serialize_verification(const ChainVerification& v) {
    const std::string first_broken =
        v.first_broken ? fmt::format("{}", *v.first_broken) : "null";
    return fmt::format(
        R"({{"intact":{},"entries_checked":{},"broken_count":{},"first_broken":{}}})",
        v.intact, v.entries_checked, v.broken_count, first_broken);
}

}  // namespace

// ---------------------------------------------------------------------------
// 직렬화 / 파싱 헬퍼
// ---------------------------------------------------------------------------
std::string serialize_snapshot(const StatsSnapshot& s) {
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        s.captured_at.time_since_epoch()).count();

    return fmt::format(
        R"({{"total_requests":{},"blocked_requests":{},"injection_blocks":{},"rate_limited":{},)"
        R"("pii_detections":{},)"
        R"("high_risk_requests":{},"responses_filtered":{},"upstream_failures":{},)"
        R"("rps":{:.4f},"block_rate":{:.4f},"captured_at_ms":{}}})",
        s.total_requests,
        s.blocked_requests,
        s.injection_blocks,
        s.rate_limited,
        s.pii_detections,
        s.high_risk_requests,
        s.responses_filtered,
        s.upstream_failures,
        s.rps,
        s.block_rate,
        epoch_ms
    );
}

RawRequest parse_inspect_request(std::string_view request_json) {
    RawRequest raw{};
    raw.prompt = find_string_field(request_json, "prompt").value_or("");
    raw.role   = find_string_field(request_json, "role").value_or("");
    raw.caller = find_string_field(request_json, "caller").value_or("");
    raw.id     = find_string_field(request_json, "request_id").value_or("");
    raw.model  = find_string_field(request_json, "model");

    // 음수, 소수, 범위 밖 값은 0 으로 넘겨 intake 에서 거부되게 한다.
    if (const auto max_tokens = find_number_field(request_json, "max_tokens")) {
        const double v = *max_tokens;
        if (v >= 0.0 && v <= static_cast<double>(std::numeric_limits<std::uint32_t>::max()) &&
            std::floor(v) == v) {
            raw.max_tokens = static_cast<std::uint32_t>(v);
        } else {
            raw.max_tokens = 0;
        }
    }
    raw.temperature = find_number_field(request_json, "temperature");
    return raw;
}

std::string serialize_inspect_payload(const GatewayResponse& response) {
    const SecurityVerdict& v = response.verdict;
    const std::string seq =
        v.audit_sequence_no ? fmt::format("{}", *v.audit_sequence_no) : "null";
    const std::string text =
        response.response_text ? json_quote(*response.response_text) : "null";
    return fmt::format(R"({{"verdict":{},"audited":{},"audit_sequence_no":{},"response":{}}})",
                       to_json(v), v.audited, seq, text);
}

// ---------------------------------------------------------------------------
// UdsServer 생성자/소멸자
// ---------------------------------------------------------------------------
UdsServer::UdsServer(const std::filesystem::path&    socket_path,
                     std::shared_ptr<StatsCollector> stats,
                     std::shared_ptr<Pipeline>       pipeline,
                     ReloadHandler                   reload,
                     asio::io_context&               ioc,
                     std::size_t                     worker_threads)
    : socket_path_{socket_path}
    , stats_{std::move(stats)}
    , pipeline_{std::move(pipeline)}
    , reload_{std::move(reload)}
    , ioc_{ioc}
    , acceptor_{ioc}
    , workers_{worker_threads == 0 ? 1 : worker_threads}
{}

UdsServer::~UdsServer() {
    stop();
    workers_.join();
}

// ---------------------------------------------------------------------------
// stop
//   acceptor를 닫아 run()의 accept 루프를 종료한다.
// ---------------------------------------------------------------------------
void UdsServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_acceptor = [this]() {
        boost::system::error_code cancel_ec;
        acceptor_.cancel(cancel_ec);
        if (cancel_ec && cancel_ec != asio::error::bad_descriptor) {
            spdlog::warn("[uds_server] stop: acceptor cancel error: {}", cancel_ec.message());
        }

        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        if (close_ec && close_ec != asio::error::bad_descriptor) {
            spdlog::warn("[uds_server] stop: acceptor close error: {}", close_ec.message());
        }
    };

    // acceptor 소유 스레드(io_context)에서 정리해 TSan 경합을 방지한다.
    if (ioc_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(ioc_, std::move(close_acceptor));
}

// ---------------------------------------------------------------------------
// dispatch
// ---------------------------------------------------------------------------
std::string UdsServer::dispatch(std::string_view request_json) {
    const std::string cmd = find_string_field(request_json, "command").value_or("");

    try {
        if (cmd == "stats") {
            if (!stats_) {
                return make_error_response("stats collector not configured");
            }
            return make_ok_response(serialize_snapshot(stats_->snapshot()));
        }
        if (cmd == "inspect") {
            if (!pipeline_) {
                return make_error_response("pipeline not configured");
            }
            const GatewayResponse response = pipeline_->handle(parse_inspect_request(request_json));
            return make_ok_response(serialize_inspect_payload(response));
        }
        if (cmd == "audit_verify") {
            if (!pipeline_) {
                return make_error_response("pipeline not configured");
            }
            const ChainVerification result = pipeline_->audit().verify();
            if (!result.intact) {
                spdlog::error("[uds_server] audit chain broken at entry {} ({} broken)",
                              result.first_broken.value_or(0), result.broken_count);
            }
            return make_ok_response(serialize_verification(result));
        }
        if (cmd == "audit_export") {
            if (!pipeline_) {
                return make_error_response("pipeline not configured");
            }
            return make_ok_response(pipeline_->audit().export_json());
        }
        if (cmd == "reload") {
            if (!reload_) {
                return make_error_response("reload not supported");
            }
            auto reloaded = reload_();
            if (!reloaded) {
                return make_error_response(reloaded.error());
            }
            return make_ok_response(R"({"reloaded":true})");
        }
    } catch (const std::exception& e) {
        spdlog::error("[uds_server] command '{}' failed: {}", cmd, e.what());
        return make_error_response(fmt::format("command '{}' failed", cmd));
    }

    if (cmd.empty()) {
        spdlog::warn("[uds_server] dispatch: missing or malformed 'command' field");
        return make_error_response("missing or malformed 'command' field");
    }
    spdlog::warn("[uds_server] dispatch: unknown command '{}'", cmd);
    return make_error_response(fmt::format("unknown command '{}'", cmd));
}

// ---------------------------------------------------------------------------
// run
//   기존 소켓 파일 제거 → bind/listen → accept 루프.
//   accept 오류 시 로그 후 루프 종료.
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("[uds_server] failed to remove old socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("[uds_server] open error: {}", ec.message());
        co_return;
    }

    acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    if (ec) {
        spdlog::error("[uds_server] bind error on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[uds_server] listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("[uds_server] listening on {}", socket_path_.string());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return;
        }

        stream_protocol::socket client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(
            client_socket, asio::redirect_error(asio::use_awaitable, accept_ec));

        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted ||
                accept_ec == boost::system::errc::bad_file_descriptor) {
                spdlog::info("[uds_server] accept loop stopped");
            } else {
                spdlog::error("[uds_server] accept error: {}", accept_ec.message());
            }
            co_return;
        }

        asio::co_spawn(ioc_, handle_client(std::move(client_socket)), asio::detached);
    }
}

// ---------------------------------------------------------------------------
// handle_client
//   단일 클라이언트 연결 처리:
//     1. 4바이트 LE 헤더로 요청 크기 읽기
//     2. JSON 바디 읽기
//     3. worker 풀에서 커맨드 디스패치
//     4. 4바이트 LE 헤더 + JSON 바디 응답 송신
//
//   오류 발생 시 로그 후 co_return (데이터패스 비전파).
// ---------------------------------------------------------------------------
asio::awaitable<void> UdsServer::handle_client(asio::local::stream_protocol::socket socket) {
    std::array<std::uint8_t, 4> req_hdr{};
    boost::system::error_code   hdr_ec;
    const std::size_t hdr_n = co_await asio::async_read(
        socket, asio::buffer(req_hdr), asio::redirect_error(asio::use_awaitable, hdr_ec));

    if (hdr_ec) {
        if (hdr_ec != asio::error::eof) {
            spdlog::warn("[uds_server] handle_client: read header error: {}", hdr_ec.message());
        }
        co_return;
    }
    if (hdr_n != req_hdr.size()) {
        spdlog::warn("[uds_server] handle_client: short header ({} bytes)", hdr_n);
        co_return;
    }

    const std::uint32_t body_len = decode_le4(req_hdr);
    if (body_len == 0 || body_len > kMaxRequestSize) {
        spdlog::warn("[uds_server] handle_client: invalid body length {}", body_len);
        co_return;
    }

    std::vector<char>         body_buf(body_len);
    boost::system::error_code body_ec;
    const std::size_t body_n = co_await asio::async_read(
        socket, asio::buffer(body_buf), asio::redirect_error(asio::use_awaitable, body_ec));

    if (body_ec) {
        spdlog::warn("[uds_server] handle_client: read body error: {}", body_ec.message());
        co_return;
    }
    if (body_n != body_len) {
        spdlog::warn("[uds_server] handle_client: short body ({}/{} bytes)", body_n, body_len);
        co_return;
    }

    std::string request_json(body_buf.data(), body_n);

    // dispatch 는 std::exception 을 오류 응답으로 바꾸므로 여기서 새는 예외는 없다.
    std::string response_body = co_await asio::co_spawn(
        workers_,
        [this, request = std::move(request_json)]() -> asio::awaitable<std::string> {
            co_return dispatch(request);
        },
        asio::use_awaitable);

    const auto resp_hdr = encode_le4(static_cast<std::uint32_t>(response_body.size()));

    std::array<asio::const_buffer, 2> bufs{
        asio::buffer(resp_hdr),
        asio::buffer(response_body),
    };
    boost::system::error_code write_ec;
    const std::size_t write_n = co_await asio::async_write(
        socket, bufs, asio::redirect_error(asio::use_awaitable, write_ec));

    if (write_ec) {
        spdlog::warn("[uds_server] handle_client: write error: {}", write_ec.message());
        co_return;
    }

    spdlog::debug("[uds_server] handled response_bytes={}", write_n);
}
