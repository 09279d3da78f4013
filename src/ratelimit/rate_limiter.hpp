#pragma once

// ---------------------------------------------------------------------------
// rate_limiter.hpp
//
// 호출자별 토큰 버킷 요청 속도 제한.
//
// [버킷 키]
//   role + 호출자 식별자. 호출자 식별자가 없으면 역할 이름을 그대로 쓴다
//   (RequestIntake 가 채움). 같은 호출자라도 역할이 다르면 다른 버킷이다.
//
// [한도]
//   역할별 한도(roles)가 있으면 그것을, 없으면 기본 한도를 쓴다.
//   requests_per_second 속도로 채워지고 burst 개까지 쌓인다.
//   새 버킷은 가득 찬 상태로 시작한다.
//
// [메모리 상한]
//   버킷 수가 max_callers 를 넘으면 가득 찬(= 한동안 요청이 없던) 버킷부터
//   지운다. 가득 찬 버킷을 지워도 다음 요청에서 같은 상태로 다시 만들어지므로
//   판정은 달라지지 않는다.
//
// [스레드 안전성]
//   check() 는 내부 mutex 로 보호된다. 동시 호출 안전.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "policy/rule.hpp"  // RateLimit, RateLimitConfig

// ---------------------------------------------------------------------------
// TokenBucket
//   try_acquire_at 은 호출자가 시각을 넘긴다 (테스트에서 시간을 고정하기 위함).
// ---------------------------------------------------------------------------
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(RateLimit limit, Clock::time_point now);

    [[nodiscard]] bool try_acquire_at(Clock::time_point now);

    // 다음 토큰 하나가 채워질 때까지 남은 시간. 토큰이 있으면 0.
    [[nodiscard]] std::chrono::milliseconds retry_after() const;

    // now 까지 refill 한 뒤 burst 만큼 차 있는지.
    [[nodiscard]] bool full_at(Clock::time_point now);
    [[nodiscard]] std::uint32_t available() const noexcept;

private:
    void refill(Clock::time_point now);

    RateLimit         limit_;
    double            tokens_;
    Clock::time_point last_refill_;
};

struct RateLimitResult {
    bool                      allowed{true};
    std::uint32_t             remaining{0};
    std::chrono::milliseconds retry_after{0};
};

class RateLimiter {
public:
    explicit RateLimiter(RateLimitConfig config);

    RateLimiter(const RateLimiter&)            = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // check
    //   요청 1건 만큼 토큰을 소비한다. 비활성화 상태면 항상 allowed.
    [[nodiscard]] RateLimitResult check(std::string_view role, std::string_view caller);
    [[nodiscard]] RateLimitResult check_at(std::string_view role, std::string_view caller,
                                           TokenBucket::Clock::time_point now);

    [[nodiscard]] bool enabled() const noexcept { return config_.enabled; }
    [[nodiscard]] std::size_t bucket_count() const;

private:
    [[nodiscard]] RateLimit limit_for(std::string_view role) const;
    void evict_full_buckets(TokenBucket::Clock::time_point now);

    RateLimitConfig                              config_;
    mutable std::mutex                           mutex_;
    std::unordered_map<std::string, TokenBucket> buckets_;
};
