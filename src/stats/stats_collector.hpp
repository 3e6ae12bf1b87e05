#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 요청 검증 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_request(): 요청 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로. 갱신 경로와 mutex 없이 atomic 로드로 분리한다.
//
// [격리 원칙]
// 통계 수집 실패가 검증 결과에 영향을 주지 않도록 갱신 메서드는 noexcept 이다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   advisory_requests : 위반은 있으나 차단되지 않은 요청 수
//   rps               : 수집기 생성 이후 평균 초당 요청 수
//   block_rate        : blocked_requests / total_requests (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         total_requests{0};
    std::uint64_t                         blocked_requests{0};
    std::uint64_t                         advisory_requests{0};
    std::uint64_t                         rate_limited_requests{0};
    double                                rps{0.0};
    double                                block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept
        : started_at_(std::chrono::steady_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    // on_request
    //   검증 1건 완료 시 호출.
    //   blocked      : is_valid == false
    //   advisory     : 위반이 있으나 is_valid == true
    //   rate_limited : RateLimitExceeded 위반 포함
    void on_request(bool blocked, bool advisory, bool rate_limited) noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        if (blocked) {
            blocked_requests_.fetch_add(1, std::memory_order_relaxed);
        } else if (advisory) {
            advisory_requests_.fetch_add(1, std::memory_order_relaxed);
        }
        if (rate_limited) {
            rate_limited_requests_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto total        = total_requests_.load(std::memory_order_relaxed);
        const auto blocked      = blocked_requests_.load(std::memory_order_relaxed);
        const auto advisory     = advisory_requests_.load(std::memory_order_relaxed);
        const auto rate_limited = rate_limited_requests_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started_at_).count();

        double rps = 0.0;
        if (elapsed_sec > 0.0) {
            rps = static_cast<double>(total) / elapsed_sec;
        }

        double block_rate = 0.0;
        if (total > 0) {
            block_rate = static_cast<double>(blocked) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_requests        = total,
            .blocked_requests      = blocked,
            .advisory_requests     = advisory,
            .rate_limited_requests = rate_limited,
            .rps                   = rps,
            .block_rate            = block_rate,
            .captured_at           = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> blocked_requests_{0};
    std::atomic<std::uint64_t> advisory_requests_{0};
    std::atomic<std::uint64_t> rate_limited_requests_{0};

    const std::chrono::steady_clock::time_point started_at_;
};
