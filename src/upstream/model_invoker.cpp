#include "upstream/model_invoker.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

GateError invoker_error(GateErrorCode code, std::string message) {
    return GateError{code, std::move(message), "model_invoker"};
}

}  // namespace

ModelInvoker::ModelInvoker(std::shared_ptr<ModelClient> client, std::size_t worker_threads)
    : client_{std::move(client)}
    , pool_{std::make_unique<boost::asio::thread_pool>(worker_threads == 0 ? 1 : worker_threads)}
{
    if (!client_) {
        throw std::invalid_argument("ModelInvoker: client must not be null");
    }
}

ModelInvoker::~ModelInvoker() {
    pool_->join();
}

std::expected<std::string, GateError> ModelInvoker::attempt(
    const std::string&        prompt,
    const ModelParams&        params,
    std::chrono::milliseconds timeout,
    const CancellationToken&  cancel) const {
    using Result = std::expected<std::string, GateError>;

    // 워커가 타임아웃 이후에 끝나도 안전하도록 입력은 복사해서 넘긴다.
    // abandoned 는 호출자가 기다림을 그만두었다는 표시다. 큐에서 늦게 꺼내진
    // 작업은 백엔드를 호출하지 않는다.
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    auto task      = std::make_shared<std::packaged_task<Result()>>(
        [client = client_, prompt, params, timeout, abandoned]() -> Result {
            if (abandoned->load(std::memory_order_acquire)) {
                return std::unexpected(invoker_error(GateErrorCode::kCancelled,
                                                     "abandoned before the model call started"));
            }
            return client->complete(prompt, params, timeout);
        });
    auto fut = task->get_future();
    boost::asio::post(*pool_, [task]() { (*task)(); });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (cancel.cancelled()) {
            abandoned->store(true, std::memory_order_release);
            return std::unexpected(invoker_error(GateErrorCode::kCancelled,
                                                 "request cancelled while awaiting model"));
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            abandoned->store(true, std::memory_order_release);
            return std::unexpected(invoker_error(
                GateErrorCode::kUpstreamTimeout,
                fmt::format("model did not respond within {} ms", timeout.count())));
        }
        const auto slice = std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now);
        if (fut.wait_for(slice) == std::future_status::ready) {
            break;
        }
    }

    try {
        return fut.get();
    } catch (const std::exception& e) {
        return std::unexpected(invoker_error(GateErrorCode::kUpstreamUnavailable,
                                             fmt::format("model client threw: {}", e.what())));
    }
}

std::expected<std::string, GateError> ModelInvoker::invoke(
    const std::string&        prompt,
    const ModelParams&        params,
    std::chrono::milliseconds timeout,
    std::uint32_t             max_attempts,
    const CancellationToken&  cancel) const {
    const std::uint32_t attempts = max_attempts == 0 ? 1 : max_attempts;

    std::expected<std::string, GateError> last =
        std::unexpected(invoker_error(GateErrorCode::kUpstreamUnavailable, "no attempt made"));

    for (std::uint32_t n = 1; n <= attempts; ++n) {
        last = attempt(prompt, params, timeout, cancel);
        if (last || last.error().code != GateErrorCode::kUpstreamUnavailable) {
            return last;
        }
        spdlog::warn("model_invoker: attempt {}/{} failed: {}", n, attempts, last.error().message);
    }
    return last;
}
