#pragma once

// ---------------------------------------------------------------------------
// fake_model_client.hpp
//
// 테스트 전용 ModelClient.
// 응답 텍스트, 실패 횟수, 지연을 테스트에서 조정하고 호출 기록을 남긴다.
//
// [지연]
// set_delay 로 지정한 시간만큼 complete() 안에서 잠든다. ModelInvoker 는
// 타임아웃 후에도 워커가 끝날 때까지 소멸자에서 기다리므로 지연은 짧게
// (수백 ms 이하) 유지할 것.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>
#include <thread>

#include "upstream/model_client.hpp"

class FakeModelClient final : public ModelClient {
public:
    explicit FakeModelClient(std::string response = "Sure, happy to help.")
        : response_{std::move(response)}
    {}

    [[nodiscard]] std::expected<std::string, GateError> complete(
        const std::string&        prompt,
        const ModelParams&        params,
        std::chrono::milliseconds timeout) override {
        calls_.fetch_add(1, std::memory_order_relaxed);

        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_prompt_  = prompt;
            last_params_  = params;
            last_timeout_ = timeout;
            delay        = delay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (failures_left_ != 0) {
            if (failures_left_ > 0) {
                --failures_left_;
            }
            return std::unexpected(GateError{failure_code_, "fake backend failure", "fake"});
        }
        return response_;
    }

    void set_response(std::string response) {
        std::lock_guard<std::mutex> lock(mutex_);
        response_ = std::move(response);
    }

    // fail_with: 처음 times 번 호출을 code 로 실패시킨다 (-1 = 항상 실패)
    void fail_with(GateErrorCode code, int times = -1) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_code_  = code;
        failures_left_ = times;
    }

    void set_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    [[nodiscard]] int calls() const noexcept {
        return calls_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::string last_prompt() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_prompt_;
    }

    [[nodiscard]] ModelParams last_params() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_params_;
    }

    [[nodiscard]] std::chrono::milliseconds last_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_timeout_;
    }

private:
    mutable std::mutex        mutex_;
    std::string               response_;
    GateErrorCode             failure_code_{GateErrorCode::kUpstreamUnavailable};
    int                       failures_left_{0};
    std::chrono::milliseconds delay_{0};
    std::string               last_prompt_{};
    ModelParams               last_params_{};
    std::chrono::milliseconds last_timeout_{0};
    std::atomic<int>          calls_{0};
};
