#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 실시간 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_request: 파이프라인에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로(제어 소켓)에서 호출. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 요청 처리 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// RequestStats
//   요청 한 건이 끝날 때 파이프라인이 채워 넘기는 플래그 묶음.
// ---------------------------------------------------------------------------
struct RequestStats {
    bool blocked{false};
    bool injection{false};          // 인젝션으로 차단됨
    bool rate_limited{false};       // 속도 제한으로 차단됨
    bool pii_detected{false};       // 프롬프트에서 PII 탐지
    bool high_risk{false};          // risk band == high
    bool response_filtered{false};  // 응답에서 비밀 유출 차단
    bool upstream_failure{false};   // 모델 호출 실패/타임아웃
};

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   rps       : 수집 시작 이후 평균 초당 요청 수
//   block_rate: blocked_requests / total_requests (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         total_requests{0};
    std::uint64_t                         blocked_requests{0};
    std::uint64_t                         injection_blocks{0};
    std::uint64_t                         rate_limited{0};
    std::uint64_t                         pii_detections{0};
    std::uint64_t                         high_risk_requests{0};
    std::uint64_t                         responses_filtered{0};
    std::uint64_t                         upstream_failures{0};
    double                                rps{0.0};
    double                                block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept
        : total_requests_{0}
        , blocked_requests_{0}
        , injection_blocks_{0}
        , rate_limited_{0}
        , pii_detections_{0}
        , high_risk_requests_{0}
        , responses_filtered_{0}
        , upstream_failures_{0}
        , window_start_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 소유권 명확화)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    // on_request
    //   요청 처리 완료 시 호출. 모든 요청은 정확히 한 번 집계된다.
    void on_request(const RequestStats& s) noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        if (s.blocked) {
            blocked_requests_.fetch_add(1, std::memory_order_relaxed);
        }
        if (s.injection) {
            injection_blocks_.fetch_add(1, std::memory_order_relaxed);
        }
        if (s.rate_limited) {
            rate_limited_.fetch_add(1, std::memory_order_relaxed);
        }
        if (s.pii_detected) {
            pii_detections_.fetch_add(1, std::memory_order_relaxed);
        }
        if (s.high_risk) {
            high_risk_requests_.fetch_add(1, std::memory_order_relaxed);
        }
        if (s.response_filtered) {
            responses_filtered_.fetch_add(1, std::memory_order_relaxed);
        }
        if (s.upstream_failure) {
            upstream_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now     = std::chrono::system_clock::now();
        const auto total   = total_requests_.load(std::memory_order_relaxed);
        const auto blocked = blocked_requests_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(now - window_start_).count();

        double rps = 0.0;
        if (elapsed_sec > 0.0) {
            rps = static_cast<double>(total) / elapsed_sec;
        }

        double block_rate = 0.0;
        if (total > 0) {
            block_rate = static_cast<double>(blocked) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_requests     = total,
            .blocked_requests   = blocked,
            .injection_blocks   = injection_blocks_.load(std::memory_order_relaxed),
            .rate_limited       = rate_limited_.load(std::memory_order_relaxed),
            .pii_detections     = pii_detections_.load(std::memory_order_relaxed),
            .high_risk_requests = high_risk_requests_.load(std::memory_order_relaxed),
            .responses_filtered = responses_filtered_.load(std::memory_order_relaxed),
            .upstream_failures  = upstream_failures_.load(std::memory_order_relaxed),
            .rps                = rps,
            .block_rate         = block_rate,
            .captured_at        = now,
        };
    }

private:
    std::atomic<std::uint64_t> total_requests_;
    std::atomic<std::uint64_t> blocked_requests_;
    std::atomic<std::uint64_t> injection_blocks_;
    std::atomic<std::uint64_t> rate_limited_;
    std::atomic<std::uint64_t> pii_detections_;
    std::atomic<std::uint64_t> high_risk_requests_;
    std::atomic<std::uint64_t> responses_filtered_;
    std::atomic<std::uint64_t> upstream_failures_;

    const std::chrono::system_clock::time_point window_start_;
};
