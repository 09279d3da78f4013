#pragma once

// ---------------------------------------------------------------------------
// cancellation.hpp
//
// 요청 단위 취소 토큰.
// 복사본끼리 같은 플래그를 공유하므로 호출자가 보관한 사본에서 cancel() 하면
// 파이프라인/모델 호출 쪽 사본에서 즉시 관측된다.
//
// [사용 위치]
// - Pipeline::handle: 단계 경계마다 cancelled() 확인
// - ModelInvoker::invoke: 응답 대기 중 주기적으로 확인
// 취소된 요청도 감사 항목은 반드시 남는다 (reason=cancelled).
// ---------------------------------------------------------------------------

#include <atomic>
#include <memory>

class CancellationToken {
public:
    CancellationToken()
        : flag_{std::make_shared<std::atomic<bool>>(false)}
    {}

    void cancel() noexcept {
        flag_->store(true, std::memory_order_release);
    }

    [[nodiscard]] bool cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
