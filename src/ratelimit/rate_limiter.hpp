#pragma once

// ---------------------------------------------------------------------------
// rate_limiter.hpp
//
// 클라이언트별 슬라이딩 윈도우 rate limiter.
//
// [정책]
// 시각 T 의 요청은 같은 클라이언트의 timestamp > T - window 인 이전 요청들과 함께 센다.
// 이미 max_requests 개가 윈도우 안에 있으면 거부한다.
// 거부된 요청은 윈도우에 기록하지 않는다 (거부가 계속 윈도우를 연장하지 않도록).
//
// [동시성 모델]
// - clients_ 맵은 std::shared_mutex 로 보호한다.
//   기존 클라이언트 조회는 shared lock 만 잡으므로 서로 다른 클라이언트 간 경합이 없다.
// - 각 ClientWindow 는 자체 mutex 를 가진다.
//   같은 클라이언트의 check-then-increment 는 이 mutex 로 직렬화된다.
// - 새 클라이언트 삽입과 idle 항목 정리만 unique lock 을 잡는다.
//
// [메모리]
// - 오래된 timestamp 는 check() 마다 지연 삭제한다.
// - idle_eviction 동안 요청이 없던 클라이언트는 다음 삽입 시점에 지연 삭제한다.
//   백그라운드 스윕 스레드는 없다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "config/security_config.hpp"

// ---------------------------------------------------------------------------
// RateLimitDecision
//   check() 결과.
//   allowed       : 이번 요청 허용 여부
//   current_count : 판정 시점 윈도우 안 요청 수 (허용 시 이번 요청 포함)
//   limit         : max_requests
//   retry_after   : 거부 시 가장 오래된 요청이 윈도우를 벗어날 때까지 남은 시간
// ---------------------------------------------------------------------------
struct RateLimitDecision {
    bool                      allowed{true};
    std::size_t               current_count{0};
    std::size_t               limit{0};
    std::chrono::milliseconds retry_after{0};
};

// ---------------------------------------------------------------------------
// RateLimiter
// ---------------------------------------------------------------------------
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    // config 의 max_requests/window 가 0 이하이면 std::invalid_argument.
    explicit RateLimiter(const RateLimitConfig& config);
    ~RateLimiter() = default;

    RateLimiter(const RateLimiter&)            = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // check
    //   client_id 의 요청 1건을 판정하고, 허용되면 윈도우에 기록한다.
    //   빈 client_id 는 추적하지 않고 허용한다.
    [[nodiscard]] RateLimitDecision check(std::string_view client_id);

    // 테스트용: 현재 시각을 주입한다.
    [[nodiscard]] RateLimitDecision check(std::string_view client_id, Clock::time_point now);

    // reset_client
    //   해당 클라이언트의 윈도우를 삭제한다. 없는 클라이언트면 아무 일도 하지 않는다.
    void reset_client(std::string_view client_id);

    // tracked_clients
    //   현재 맵에 남아있는 클라이언트 수 (idle 항목 지연 삭제 전 값 포함).
    [[nodiscard]] std::size_t tracked_clients() const;

    [[nodiscard]] const RateLimitConfig& config() const noexcept { return config_; }

private:
    struct ClientWindow {
        std::mutex                    mutex;
        std::deque<Clock::time_point> timestamps;
        Clock::time_point             last_seen{};
        bool                          evicted{false};   // 맵에서 제거됨 (mutex 보호)
    };

    // 맵에서 창을 찾거나 만든다. 만들 때 idle 항목을 정리한다.
    std::shared_ptr<ClientWindow> acquire_window(std::string_view client_id, Clock::time_point now);

    // clients_ unique lock 을 잡은 상태에서 호출해야 한다.
    // 전체 순회는 window 당 최대 1회로 제한한다.
    void evict_idle_locked(Clock::time_point now);

    RateLimitConfig config_;

    mutable std::shared_mutex                                      clients_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ClientWindow>> clients_;
    Clock::time_point                                              last_sweep_{};   // clients_mutex_ 보호
};
