// ---------------------------------------------------------------------------
// rate_limiter.cpp
//
// [evicted 플래그]
// 창을 얻은 스레드가 창 mutex 를 잡기 전에 다른 스레드가 그 창을 맵에서 제거할 수 있다.
// 제거된 창에 기록하면 그 요청은 이후 판정에서 사라지므로,
// evicted 를 확인하고 맵에서 다시 얻는다.
// ---------------------------------------------------------------------------

#include "ratelimit/rate_limiter.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

RateLimiter::RateLimiter(const RateLimitConfig& config)
    : config_(config) {
    if (config_.max_requests == 0) {
        throw std::invalid_argument("rate_limiter: max_requests must be positive");
    }
    if (config_.window.count() <= 0) {
        throw std::invalid_argument("rate_limiter: window must be positive");
    }
    if (config_.idle_eviction < config_.window) {
        throw std::invalid_argument("rate_limiter: idle_eviction must not be shorter than window");
    }
}

RateLimitDecision RateLimiter::check(std::string_view client_id) {
    return check(client_id, Clock::now());
}

RateLimitDecision RateLimiter::check(std::string_view client_id, Clock::time_point now) {
    if (client_id.empty()) {
        return RateLimitDecision{
            .allowed       = true,
            .current_count = 0,
            .limit         = config_.max_requests,
            .retry_after   = std::chrono::milliseconds{0},
        };
    }

    for (;;) {
        auto window = acquire_window(client_id, now);

        std::lock_guard lock(window->mutex);
        if (window->evicted) {
            continue;
        }

        // 1. 윈도우 밖 timestamp 지연 삭제 (timestamp <= now - window)
        const auto cutoff = now - config_.window;
        while (!window->timestamps.empty() && window->timestamps.front() <= cutoff) {
            window->timestamps.pop_front();
        }
        window->last_seen = now;

        // 2. 판정 및 기록 (같은 잠금 안에서 수행)
        if (window->timestamps.size() >= config_.max_requests) {
            const auto oldest      = window->timestamps.front();
            const auto retry_after = std::chrono::duration_cast<std::chrono::milliseconds>(
                oldest + config_.window - now);
            return RateLimitDecision{
                .allowed       = false,
                .current_count = window->timestamps.size(),
                .limit         = config_.max_requests,
                .retry_after   = retry_after,
            };
        }

        window->timestamps.push_back(now);
        return RateLimitDecision{
            .allowed       = true,
            .current_count = window->timestamps.size(),
            .limit         = config_.max_requests,
            .retry_after   = std::chrono::milliseconds{0},
        };
    }
}

void RateLimiter::reset_client(std::string_view client_id) {
    std::unique_lock map_lock(clients_mutex_);
    const auto it = clients_.find(std::string{client_id});
    if (it == clients_.end()) {
        return;
    }
    {
        std::lock_guard window_lock(it->second->mutex);
        it->second->evicted = true;
    }
    clients_.erase(it);
}

std::size_t RateLimiter::tracked_clients() const {
    std::shared_lock lock(clients_mutex_);
    return clients_.size();
}

std::shared_ptr<RateLimiter::ClientWindow>
RateLimiter::acquire_window(std::string_view client_id, Clock::time_point now) {
    const std::string key{client_id};
    {
        std::shared_lock lock(clients_mutex_);
        const auto it = clients_.find(key);
        if (it != clients_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(clients_mutex_);
    // 다른 스레드가 먼저 삽입했을 수 있다
    const auto it = clients_.find(key);
    if (it != clients_.end()) {
        return it->second;
    }

    evict_idle_locked(now);

    auto window = std::make_shared<ClientWindow>();
    window->last_seen = now;
    clients_.emplace(key, window);
    return window;
}

void RateLimiter::evict_idle_locked(Clock::time_point now) {
    if (last_sweep_ != Clock::time_point{} && now - last_sweep_ < config_.window) {
        return;
    }
    last_sweep_ = now;

    std::size_t evicted = 0;
    for (auto it = clients_.begin(); it != clients_.end();) {
        auto& window = it->second;
        // 사용 중인 창은 건너뛴다 (다음 정리 기회에 다시 확인)
        std::unique_lock window_lock(window->mutex, std::try_to_lock);
        if (window_lock.owns_lock() && now - window->last_seen >= config_.idle_eviction) {
            window->evicted = true;
            window_lock.unlock();
            it = clients_.erase(it);
            ++evicted;
            continue;
        }
        ++it;
    }
    if (evicted > 0) {
        spdlog::debug("rate_limiter: evicted {} idle client window(s), {} remaining",
                      evicted, clients_.size());
    }
}
