// ---------------------------------------------------------------------------
// test_rate_limiter.cpp
//
// RateLimiter 단위 테스트.
//
// [테스트 범위]
// - N 개까지 허용, N+1 번째 거부
// - 다른 클라이언트는 영향 없음
// - 슬라이딩 윈도우 경계 (timestamp > T - W 만 집계)
// - 거부된 요청은 윈도우에 기록하지 않음
// - retry_after 계산
// - 빈 client_id 는 추적하지 않음
// - idle 클라이언트 지연 삭제, reset_client
// - 같은 클라이언트 동시 요청: 정확히 N 개만 허용 (check-then-increment 원자성)
// - 생성자 설정 검사
//
// 시간은 check(id, now) 로 주입하여 sleep 없이 결정적으로 검증한다.
// ---------------------------------------------------------------------------

#include "ratelimit/rate_limiter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

RateLimitConfig make_config(std::size_t max_requests, std::chrono::milliseconds window) {
    RateLimitConfig config;
    config.max_requests  = max_requests;
    config.window        = window;
    config.idle_eviction = window * 10;
    return config;
}

}  // namespace

TEST(RateLimiter, NPlusOneRejected_OtherClientUnaffected) {
    RateLimiter limiter(make_config(3, 60s));
    const auto  t0 = RateLimiter::Clock::now();

    for (int i = 0; i < 3; ++i) {
        const auto d = limiter.check("client-a", t0);
        EXPECT_TRUE(d.allowed) << "request " << i + 1 << " should be admitted";
        EXPECT_EQ(d.current_count, static_cast<std::size_t>(i + 1));
    }

    const auto rejected = limiter.check("client-a", t0);
    EXPECT_FALSE(rejected.allowed) << "4th request within window must be rejected";
    EXPECT_EQ(rejected.current_count, 3u);
    EXPECT_EQ(rejected.limit, 3u);

    const auto other = limiter.check("client-b", t0);
    EXPECT_TRUE(other.allowed) << "different client in the same instant must be unaffected";
}

TEST(RateLimiter, SlidingWindowBoundary) {
    RateLimiter limiter(make_config(2, 10s));
    const auto  t0 = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.check("c", t0).allowed);
    EXPECT_TRUE(limiter.check("c", t0 + 5s).allowed);
    EXPECT_FALSE(limiter.check("c", t0 + 9s).allowed);

    // t0 + 10s: t0 의 요청은 timestamp > T - W 조건을 만족하지 않으므로 빠진다
    EXPECT_TRUE(limiter.check("c", t0 + 10s).allowed);
    EXPECT_FALSE(limiter.check("c", t0 + 11s).allowed);
    EXPECT_TRUE(limiter.check("c", t0 + 15s).allowed);
}

TEST(RateLimiter, RejectedRequestsNotRecorded) {
    RateLimiter limiter(make_config(1, 10s));
    const auto  t0 = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.check("c", t0).allowed);
    for (int i = 1; i < 10; ++i) {
        EXPECT_FALSE(limiter.check("c", t0 + std::chrono::seconds{i}).allowed);
    }
    // 거부가 윈도우를 연장하지 않으므로 t0 + 10s 에 다시 허용된다
    EXPECT_TRUE(limiter.check("c", t0 + 10s).allowed);
}

TEST(RateLimiter, RetryAfterPointsToOldestExpiry) {
    RateLimiter limiter(make_config(2, 10s));
    const auto  t0 = RateLimiter::Clock::now();

    ASSERT_TRUE(limiter.check("c", t0).allowed);
    ASSERT_TRUE(limiter.check("c", t0 + 2s).allowed);

    const auto d = limiter.check("c", t0 + 4s);
    ASSERT_FALSE(d.allowed);
    EXPECT_EQ(d.retry_after, 6s);
}

TEST(RateLimiter, EmptyClientIdNotTracked) {
    RateLimiter limiter(make_config(1, 10s));
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(limiter.check("").allowed);
    }
    EXPECT_EQ(limiter.tracked_clients(), 0u);
}

TEST(RateLimiter, IdleClientsEvictedLazily) {
    RateLimitConfig config;
    config.max_requests  = 5;
    config.window        = 1s;
    config.idle_eviction = 10s;
    RateLimiter limiter(config);

    const auto t0 = RateLimiter::Clock::now();
    ASSERT_TRUE(limiter.check("idle", t0).allowed);
    ASSERT_TRUE(limiter.check("active", t0 + 5s).allowed);
    EXPECT_EQ(limiter.tracked_clients(), 2u);

    // 새 클라이언트 삽입 시점에 idle 항목이 정리된다
    ASSERT_TRUE(limiter.check("newcomer", t0 + 11s).allowed);
    EXPECT_EQ(limiter.tracked_clients(), 2u) << "only 'idle' should have been evicted";

    // 삭제된 클라이언트는 빈 윈도우로 다시 시작한다
    const auto d = limiter.check("idle", t0 + 11s);
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.current_count, 1u);
}

TEST(RateLimiter, ResetClientClearsWindow) {
    RateLimiter limiter(make_config(1, 60s));
    const auto  t0 = RateLimiter::Clock::now();

    ASSERT_TRUE(limiter.check("c", t0).allowed);
    ASSERT_FALSE(limiter.check("c", t0).allowed);

    limiter.reset_client("c");
    EXPECT_EQ(limiter.tracked_clients(), 0u);
    EXPECT_TRUE(limiter.check("c", t0).allowed);

    limiter.reset_client("unknown");   // no-op
}

// ---------------------------------------------------------------------------
// SameClientConcurrent_ExactlyNAdmitted
//   같은 클라이언트에 대한 동시 요청에서 허용 수가 정확히 N 이어야 한다.
// ---------------------------------------------------------------------------
TEST(RateLimiter, SameClientConcurrent_ExactlyNAdmitted) {
    constexpr std::size_t kLimit     = 50;
    constexpr int         kThreads   = 8;
    constexpr int         kPerThread = 100;

    RateLimiter limiter(make_config(kLimit, 1h));

    std::atomic<std::size_t> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                if (limiter.check("shared").allowed) {
                    admitted.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(admitted.load(), kLimit);
}

TEST(RateLimiter, DistinctClientsConcurrent_EachGetsFullQuota) {
    constexpr std::size_t kLimit   = 20;
    constexpr int         kClients = 16;

    RateLimiter limiter(make_config(kLimit, 1h));

    std::vector<std::size_t> admitted(kClients, 0);
    std::vector<std::thread> threads;
    for (int c = 0; c < kClients; ++c) {
        threads.emplace_back([&, c] {
            const std::string id = "client-" + std::to_string(c);
            for (std::size_t i = 0; i < kLimit * 2; ++i) {
                if (limiter.check(id).allowed) {
                    ++admitted[static_cast<std::size_t>(c)];
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    for (int c = 0; c < kClients; ++c) {
        EXPECT_EQ(admitted[static_cast<std::size_t>(c)], kLimit) << "client-" << c;
    }
    EXPECT_EQ(limiter.tracked_clients(), static_cast<std::size_t>(kClients));
}

TEST(RateLimiter, InvalidConfigThrows) {
    EXPECT_THROW(RateLimiter(make_config(0, 10s)), std::invalid_argument);
    EXPECT_THROW(RateLimiter(make_config(5, 0ms)), std::invalid_argument);

    RateLimitConfig config = make_config(5, 10s);
    config.idle_eviction   = 5s;
    EXPECT_THROW(RateLimiter{config}, std::invalid_argument);
}
