#pragma once

// ---------------------------------------------------------------------------
// uds_server.hpp
//
// Unix Domain Socket 제어 서버. 운영 CLI 와 외부 프런트엔드(HTTP 등)가
// 파이프라인에 접근하는 인계 지점이다.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청 프레임:
//     [4byte LE 길이][JSON 본문]
//     예: {"command": "inspect", "prompt": "...", "role": "user"}
//
//   응답 프레임:
//     [4byte LE 길이][JSON 본문]
//     성공: {"ok": true,  "payload": { ... }}
//     실패: {"ok": false, "error": "<메시지>"}
//
// [지원 커맨드]
//   "stats": StatsSnapshot 반환
//   "inspect": Pipeline::handle 실행. 필드: prompt, role, caller, request_id,
//                    model, max_tokens, temperature
//                    payload: {"verdict":{...},"audited","audit_sequence_no","response"}
//   "audit_verify": 감사 파일을 다시 읽어 체인 재계산 결과
//   "audit_export": 감사 항목 전체를 JSON 배열로 반환
//   "reload": 설정 파일을 다시 읽어 런타임 설정 교체
//
// [스레드/비동기 모델]
//   Boost.Asio co_await 기반. io_context 는 외부에서 주입.
//   커맨드 처리(dispatch)는 내부 worker 풀에서 실행한다. inspect 가 모델
//   호출 동안 블로킹되어도 accept 루프는 io_context 스레드에서 계속 돈다.
//   stop() 은 acceptor 를 닫아 run() 을 종료시킨다.
//
// [격리 원칙]
//   UDS I/O 실패가 데이터패스 실패로 전파되지 않는다.
//   잘못된 프레임은 해당 연결만 닫는다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/thread_pool.hpp>

#include "gateway/pipeline.hpp"
#include "stats/stats_collector.hpp"

namespace asio = boost::asio;

// ReloadHandler
//   "reload" 커맨드에서 호출. 실패 시 사람이 읽을 수 있는 오류 메시지.
using ReloadHandler = std::function<std::expected<void, std::string>()>;

class UdsServer {
public:
    // 단일 클라이언트에서 수신할 최대 메시지 크기 (4MiB)
    static constexpr std::uint32_t kMaxRequestSize = 4u * 1024u * 1024u;

    // 생성자
    //   socket_path    : Unix Domain Socket 파일 경로
    //   stats          : 공유 통계 수집기 (read-only 접근만 수행)
    //   pipeline       : inspect/audit_verify 대상
    //   reload         : reload 커맨드 처리기 (빈 함수면 reload 는 오류 응답)
    //   ioc            : 외부에서 주입된 Asio io_context
    //   worker_threads : 커맨드 처리 스레드 수
    UdsServer(const std::filesystem::path&    socket_path,
              std::shared_ptr<StatsCollector> stats,
              std::shared_ptr<Pipeline>       pipeline,
              ReloadHandler                   reload,
              asio::io_context&               ioc,
              std::size_t                     worker_threads);

    ~UdsServer();

    UdsServer(const UdsServer&)            = delete;
    UdsServer& operator=(const UdsServer&) = delete;
    UdsServer(UdsServer&&)                 = delete;
    UdsServer& operator=(UdsServer&&)      = delete;

    // run
    //   UDS 소켓 바인드/리슨 후 accept 루프를 실행한다.
    //   호출자는 co_spawn 으로 이 코루틴을 구동해야 한다.
    asio::awaitable<void> run();

    // stop
    //   acceptor 를 닫아 run() 의 accept 루프를 종료한다.
    void stop();

    // dispatch
    //   요청 JSON 한 건을 처리해 응답 JSON 을 만든다. 블로킹 (inspect 는 모델 호출 포함).
    //   소켓 경로에서는 worker 풀에서 호출된다.
    [[nodiscard]] std::string dispatch(std::string_view request_json);

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    std::filesystem::path                  socket_path_;
    std::shared_ptr<StatsCollector>        stats_;
    std::shared_ptr<Pipeline>              pipeline_;
    ReloadHandler                          reload_;
    asio::io_context&                      ioc_;
    asio::local::stream_protocol::acceptor acceptor_;
    asio::thread_pool                      workers_;
    std::atomic<bool>                      stop_requested_{false};
};

// inspect 요청 JSON → RawRequest. 필드 누락은 intake 단계에서 거부된다.
[[nodiscard]] RawRequest parse_inspect_request(std::string_view request_json);

// GatewayResponse → inspect payload JSON
[[nodiscard]] std::string serialize_inspect_payload(const GatewayResponse& response);

// StatsSnapshot → JSON (captured_at 은 epoch 밀리초)
[[nodiscard]] std::string serialize_snapshot(const StatsSnapshot& snapshot);
