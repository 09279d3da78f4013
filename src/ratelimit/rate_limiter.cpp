// ---------------------------------------------------------------------------
// rate_limiter.cpp
//
// [refill]
//   경과 시간 * requests_per_second 만큼 토큰을 더하고 burst 에서 자른다.
//   토큰은 double 로 보관하므로 1초 미만 간격의 요청도 부분 토큰이 쌓인다.
// ---------------------------------------------------------------------------

#include "ratelimit/rate_limiter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

TokenBucket::TokenBucket(RateLimit limit, Clock::time_point now)
    : limit_{limit}
    , tokens_{static_cast<double>(limit.burst)}
    , last_refill_{now}
{}

void TokenBucket::refill(Clock::time_point now) {
    if (now <= last_refill_) {
        return;
    }
    const std::chrono::duration<double> elapsed = now - last_refill_;
    tokens_ = std::min(static_cast<double>(limit_.burst),
                       tokens_ + elapsed.count() * limit_.requests_per_second);
    last_refill_ = now;
}

bool TokenBucket::try_acquire_at(Clock::time_point now) {
    refill(now);
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    return true;
}

std::chrono::milliseconds TokenBucket::retry_after() const {
    if (tokens_ >= 1.0 || limit_.requests_per_second == 0) {
        return std::chrono::milliseconds{0};
    }
    const double seconds = (1.0 - tokens_) / limit_.requests_per_second;
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::ceil(seconds * 1000.0))};
}

bool TokenBucket::full_at(Clock::time_point now) {
    refill(now);
    return tokens_ >= static_cast<double>(limit_.burst);
}

std::uint32_t TokenBucket::available() const noexcept {
    return static_cast<std::uint32_t>(tokens_);
}

RateLimiter::RateLimiter(RateLimitConfig config)
    : config_{std::move(config)}
{
    if (config_.enabled) {
        spdlog::info("rate_limiter: {} req/s burst {} by default, {} role overrides",
                     config_.defaults.requests_per_second, config_.defaults.burst,
                     config_.roles.size());
    }
}

RateLimit RateLimiter::limit_for(std::string_view role) const {
    const auto it = config_.roles.find(to_lower(role));
    return it != config_.roles.end() ? it->second : config_.defaults;
}

RateLimitResult RateLimiter::check(std::string_view role, std::string_view caller) {
    return check_at(role, caller, TokenBucket::Clock::now());
}

RateLimitResult RateLimiter::check_at(std::string_view               role,
                                      std::string_view               caller,
                                      TokenBucket::Clock::time_point now) {
    if (!config_.enabled) {
        return RateLimitResult{};
    }

    std::string key = to_lower(role);
    key += '\n';
    key.append(caller);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        if (buckets_.size() >= config_.max_callers) {
            evict_full_buckets(now);
        }
        it = buckets_.emplace(std::move(key), TokenBucket(limit_for(role), now)).first;
    }

    TokenBucket& bucket = it->second;
    const bool allowed  = bucket.try_acquire_at(now);
    return RateLimitResult{
        .allowed     = allowed,
        .remaining   = bucket.available(),
        .retry_after = allowed ? std::chrono::milliseconds{0} : bucket.retry_after(),
    };
}

void RateLimiter::evict_full_buckets(TokenBucket::Clock::time_point now) {
    const auto before = buckets_.size();
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        it = it->second.full_at(now) ? buckets_.erase(it) : std::next(it);
    }
    spdlog::debug("rate_limiter: evicted {} idle buckets", before - buckets_.size());
    if (buckets_.size() >= config_.max_callers) {
        spdlog::warn("rate_limiter: {} active callers exceed max_callers {}",
                     buckets_.size(), config_.max_callers);
    }
}

std::size_t RateLimiter::bucket_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}
