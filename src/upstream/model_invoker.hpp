#pragma once

// ---------------------------------------------------------------------------
// model_invoker.hpp
//
// 모델 호출 실행기. ModelClient::complete 를 워커 풀에서 실행하고
// 호출자 지정 타임아웃, 제한된 재시도, 취소를 적용한다.
//
// [정책]
// - 시도마다 최대 timeout 만큼 기다린다. 초과 시 kUpstreamTimeout 을
//   즉시 반환하고 재시도하지 않는다 (파이프라인이 무한정 매달리지 않음).
// - kUpstreamUnavailable 만 재시도 대상이다. 총 시도 횟수는 max_attempts.
// - 기다리는 동안 CancellationToken 을 주기적으로 확인하고, 취소되면
//   kCancelled 를 반환한다.
//
// - complete() 에는 같은 timeout 을 넘긴다. 백엔드가 스스로 기한 초과를
//   보고해도 kUpstreamTimeout 이므로 재시도하지 않는다.
//
// [알려진 한계]
// 타임아웃/취소 후에도 이미 시작된 complete() 호출은 워커 스레드에서
// 끝까지 실행된다 (결과는 버려진다). 워커 풀에서 아직 시작하지 못한 작업은
// 포기 표시를 보고 백엔드를 호출하지 않고 끝난다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio/thread_pool.hpp>

#include "common/cancellation.hpp"
#include "common/types.hpp"
#include "upstream/model_client.hpp"

class ModelInvoker {
public:
    static constexpr std::chrono::milliseconds kPollInterval{10};

    ModelInvoker(std::shared_ptr<ModelClient> client, std::size_t worker_threads);

    // 소멸 시 워커 풀을 join 한다.
    ~ModelInvoker();

    ModelInvoker(const ModelInvoker&)            = delete;
    ModelInvoker& operator=(const ModelInvoker&) = delete;

    // invoke
    //   성공: 모델 응답 텍스트
    //   실패: kUpstreamTimeout | kUpstreamUnavailable | kCancelled
    [[nodiscard]] std::expected<std::string, GateError> invoke(
        const std::string&        prompt,
        const ModelParams&        params,
        std::chrono::milliseconds timeout,
        std::uint32_t             max_attempts,
        const CancellationToken&  cancel) const;

private:
    [[nodiscard]] std::expected<std::string, GateError> attempt(
        const std::string&        prompt,
        const ModelParams&        params,
        std::chrono::milliseconds timeout,
        const CancellationToken&  cancel) const;

    std::shared_ptr<ModelClient>               client_;
    std::unique_ptr<boost::asio::thread_pool>  pool_;
};
