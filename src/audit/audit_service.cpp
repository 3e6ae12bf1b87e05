// ---------------------------------------------------------------------------
// audit_service.cpp
//
// AuditService 구현.
//
// [깨우기 규칙]
// flush_loop() 는 대기 직전에 매번 next_deadline() 을 다시 계산한다.
// record() 는 아래 경우에만 타이머를 취소해 루프가 deadline 을 다시 계산하게 한다.
//   - 큐가 비어 있다가 첫 이벤트가 들어온 경우 (max() 대기 → oldest + max_age)
//   - 큐 길이가 flush_threshold 에 도달한 경우
// 취소 핸들러도 워커 스레드에서 실행되므로, 루프가 async_wait 에 있을 때만 도착한다.
// ---------------------------------------------------------------------------

#include "audit/audit_service.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

namespace asio = boost::asio;

// ---------------------------------------------------------------------------
// 생성자 / 소멸자
// ---------------------------------------------------------------------------
AuditService::AuditService(const AuditConfig& config, std::shared_ptr<AuditSink> sink)
    : config_(config)
    , sink_(std::move(sink))
    , timer_(io_ctx_)
{
    if (!sink_) {
        throw std::invalid_argument("audit_service: sink must not be null");
    }
    if (config_.flush_threshold == 0) {
        throw std::invalid_argument("audit_service: flush_threshold must be positive");
    }
    if (config_.buffer_capacity < config_.flush_threshold) {
        throw std::invalid_argument("audit_service: buffer_capacity must be >= flush_threshold");
    }
    if (config_.max_buffer_age.count() <= 0 || config_.delivery_timeout.count() <= 0) {
        throw std::invalid_argument("audit_service: max_buffer_age and delivery_timeout must be positive");
    }

    work_guard_.emplace(asio::make_work_guard(io_ctx_));

    asio::co_spawn(
        io_ctx_,
        flush_loop(),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("audit_service: flush loop terminated: {}", e.what());
                }
            }
        }
    );

    worker_ = std::thread([this] { io_ctx_.run(); });

    spdlog::debug("audit_service: started (buffering={}, threshold={}, max_age={}ms, capacity={})",
                  config_.enable_buffering, config_.flush_threshold,
                  config_.max_buffer_age.count(), config_.buffer_capacity);
}

AuditService::~AuditService() {
    stopping_.store(true, std::memory_order_release);
    wake();
    work_guard_.reset();
    if (worker_.joinable()) {
        worker_.join();
    }

    // 루프가 비정상 종료한 경우 워커 없이 마지막 전달을 시도한다
    if (stats().buffered > 0) {
        static_cast<void>(drain_once());
    }

    const auto remaining = stats().buffered;
    if (remaining > 0) {
        spdlog::error("audit_service: {} event(s) undelivered at shutdown", remaining);
    }
}

// ---------------------------------------------------------------------------
// record
// ---------------------------------------------------------------------------
void AuditService::record(AuditEvent event) {
    if (event.severity < config_.minimum_log_level) {
        filtered_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    bool should_wake = false;
    {
        std::lock_guard lock(mutex_);
        // sequence 부여와 push 를 같은 임계 구역에서 해야 큐 순서 == sequence 순서
        event.sequence = ++sequence_;
        buffer_.push_back(Pending{std::move(event), Clock::now()});
        recorded_.fetch_add(1, std::memory_order_relaxed);
        enforce_capacity_locked();

        const auto size = buffer_.size();
        should_wake = size == 1 || size == config_.flush_threshold;
    }

    if (!config_.enable_buffering) {
        static_cast<void>(flush());
        return;
    }

    if (should_wake) {
        wake();
    }
}

// ---------------------------------------------------------------------------
// flush
//   워커 스레드에 drain 작업을 post 하고 결과를 기다린다.
//   워커 스레드 자신이 호출한 경우(sink 내부에서 record 등)는 바로 실행한다.
// ---------------------------------------------------------------------------
DeliveryStatus AuditService::flush() {
    if (io_ctx_.get_executor().running_in_this_thread() || io_ctx_.stopped()) {
        return drain_once();
    }

    std::packaged_task<DeliveryStatus()> task([this] { return drain_once(); });
    auto result = task.get_future();
    asio::post(io_ctx_, std::move(task));

    // 진행 중인 전달 1회 + 이번 전달. 넘기면 결과를 기다리지 않는다.
    // 워커에서 계속 실행되는 전달은 끝난 뒤 drain_once() 가 실패로 집계한다.
    if (result.wait_for(2 * config_.delivery_timeout) != std::future_status::ready) {
        spdlog::warn("audit_service: flush did not complete within {}ms",
                     (2 * config_.delivery_timeout).count());
        return DeliveryStatus::kTimedOut;
    }
    return result.get();
}

AuditStats AuditService::stats() const {
    std::size_t buffered = 0;
    {
        std::lock_guard lock(mutex_);
        buffered = buffer_.size();
    }
    return AuditStats{
        .recorded          = recorded_.load(std::memory_order_relaxed),
        .filtered          = filtered_.load(std::memory_order_relaxed),
        .delivered         = delivered_.load(std::memory_order_relaxed),
        .dropped           = dropped_.load(std::memory_order_relaxed),
        .failed_deliveries = failed_deliveries_.load(std::memory_order_relaxed),
        .buffered          = buffered,
    };
}

// ---------------------------------------------------------------------------
// flush_loop (워커 스레드)
// ---------------------------------------------------------------------------
asio::awaitable<void> AuditService::flush_loop() {
    for (;;) {
        const auto now      = Clock::now();
        const auto deadline = next_deadline(now);

        if (deadline <= now) {
            static_cast<void>(drain_once());
            if (stopping_.load(std::memory_order_acquire)) {
                co_return;
            }
            continue;
        }

        timer_.expires_at(deadline);
        boost::system::error_code ec;
        co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        // operation_aborted 는 wake() 에 의한 정상 취소이다. deadline 을 다시 계산한다.
    }
}

AuditService::Clock::time_point AuditService::next_deadline(Clock::time_point now) const {
    if (stopping_.load(std::memory_order_acquire)) {
        return now;
    }

    std::lock_guard lock(mutex_);
    if (buffer_.empty()) {
        return Clock::time_point::max();
    }

    const auto due = buffer_.size() >= config_.flush_threshold
                         ? now
                         : buffer_.front().enqueued_at + config_.max_buffer_age;
    return std::max(due, retry_not_before_);
}

// ---------------------------------------------------------------------------
// drain_once
//   1. 잠금 안에서 큐 전체를 꺼낸다
//   2. 잠금 없이 sink 호출
//   3. 실패 시 큐 앞쪽에 되돌리고 capacity 를 다시 적용한다
// ---------------------------------------------------------------------------
DeliveryStatus AuditService::drain_once() {
    std::vector<AuditEvent>        batch;
    std::vector<Clock::time_point> enqueued_at;
    {
        std::lock_guard lock(mutex_);
        if (buffer_.empty()) {
            return DeliveryStatus::kDelivered;
        }
        batch.reserve(buffer_.size());
        enqueued_at.reserve(buffer_.size());
        for (auto& pending : buffer_) {
            batch.push_back(std::move(pending.event));
            enqueued_at.push_back(pending.enqueued_at);
        }
        buffer_.clear();
    }

    const auto started = Clock::now();
    DeliveryStatus status = DeliveryStatus::kFailed;
    try {
        status = sink_->deliver(batch, config_.delivery_timeout);
    } catch (const std::exception& e) {
        spdlog::error("audit_service: sink threw during delivery: {}", e.what());
        status = DeliveryStatus::kFailed;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

    // 제한 시간을 넘긴 전달은 sink 결과와 무관하게 타임아웃이다.
    // 배치를 되돌리면 sink 는 같은 sequence 를 다시 받는다.
    if (status == DeliveryStatus::kDelivered && elapsed > config_.delivery_timeout) {
        spdlog::warn("audit_service: sink took {}ms for {} event(s), timeout is {}ms",
                     elapsed.count(), batch.size(), config_.delivery_timeout.count());
        status = DeliveryStatus::kTimedOut;
    }

    if (status == DeliveryStatus::kDelivered) {
        delivered_.fetch_add(batch.size(), std::memory_order_relaxed);
        retry_not_before_ = Clock::time_point{};
        spdlog::debug("audit_service: delivered {} event(s) in {}ms", batch.size(), elapsed.count());
        return status;
    }

    failed_deliveries_.fetch_add(1, std::memory_order_relaxed);
    retry_not_before_ = Clock::now() + config_.max_buffer_age;

    std::size_t buffered = 0;
    {
        std::lock_guard lock(mutex_);
        // 실패한 배치는 그 사이 들어온 이벤트보다 오래되었으므로 앞쪽에 넣는다
        std::deque<Pending> restored;
        for (std::size_t i = 0; i < batch.size(); ++i) {
            restored.push_back(Pending{std::move(batch[i]), enqueued_at[i]});
        }
        buffer_.insert(buffer_.begin(),
                       std::make_move_iterator(restored.begin()),
                       std::make_move_iterator(restored.end()));
        enforce_capacity_locked();
        buffered = buffer_.size();
    }

    spdlog::warn("audit_service: delivery {} after {}ms, {} event(s) kept for retry",
                 delivery_status_to_string(status), elapsed.count(), buffered);
    return status;
}

void AuditService::enforce_capacity_locked() {
    std::size_t dropped = 0;
    while (buffer_.size() > config_.buffer_capacity) {
        buffer_.pop_front();
        ++dropped;
    }
    if (dropped > 0) {
        dropped_.fetch_add(dropped, std::memory_order_relaxed);
        spdlog::warn("audit_service: buffer capacity {} reached, dropped {} oldest event(s)",
                     config_.buffer_capacity, dropped);
    }
}

void AuditService::wake() {
    asio::post(io_ctx_, [this] { timer_.cancel(); });
}
