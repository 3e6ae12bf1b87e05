#pragma once

// ---------------------------------------------------------------------------
// audit_service.hpp
//
// 감사 이벤트 필터링/버퍼링/배치 전달 서비스.
//
// [동작]
// - record(): minimum_log_level 미만은 버린다 (filtered 카운트).
//   버퍼링 활성 시 메모리 큐에 넣고 즉시 반환한다.
//   버퍼링 비활성 시 flush 경로에서 전달이 끝날 때까지 기다린다.
// - flush 조건: 큐 크기 >= flush_threshold, 또는 가장 오래된 이벤트의 나이 >= max_buffer_age.
// - 전달 실패(타임아웃 포함) 시 배치를 큐 앞쪽에 되돌려 다음 flush 에서 재시도한다.
//   재시도는 max_buffer_age 만큼 간격을 둔다.
// - sink 호출이 delivery_timeout 을 넘기면 sink 가 성공을 반환해도 타임아웃으로 본다.
//   flush() 는 최대 2 * delivery_timeout 까지만 기다린다.
//   소멸자는 진행 중인 sink 호출이 반환될 때까지 기다린다.
// - buffer_capacity 초과 시 가장 오래된 이벤트부터 버리고 dropped 로 센다.
//
// [스레드 모델]
// - 내부 io_context 를 전용 워커 스레드 1개가 구동한다.
// - flush_loop() 코루틴이 steady_timer 로 다음 flush 시각까지 대기한다.
//   sink 호출은 항상 이 스레드에서만 일어나므로 flush 가 동시에 실행되지 않는다.
// - record() 는 mutex 로 보호된 deque 에 push 만 하고, 필요하면 타이머를 깨운다.
// - sink 호출 중에는 mutex 를 잡지 않는다 (배치를 먼저 꺼낸 뒤 호출).
//
// [종료]
// 소멸자는 남은 이벤트를 한 번 더 전달 시도한 뒤 워커 스레드를 join 한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "audit/audit_sink.hpp"
#include "audit/audit_types.hpp"
#include "config/security_config.hpp"

// ---------------------------------------------------------------------------
// AuditStats
//   stats() 가 반환하는 카운터 스냅샷.
// ---------------------------------------------------------------------------
struct AuditStats {
    std::uint64_t recorded{0};            // 필터 통과 후 큐에 들어간 이벤트 수
    std::uint64_t filtered{0};            // minimum_log_level 미만으로 버린 수
    std::uint64_t delivered{0};           // sink 전달 성공 이벤트 수
    std::uint64_t dropped{0};             // buffer_capacity 초과로 버린 수
    std::uint64_t failed_deliveries{0};   // 실패/타임아웃 배치 수
    std::size_t   buffered{0};            // 현재 큐 길이
};

class AuditService {
public:
    using Clock = std::chrono::steady_clock;

    // 생성자
    //   sink 가 null 이거나 config 가 잘못되면 std::invalid_argument.
    AuditService(const AuditConfig& config, std::shared_ptr<AuditSink> sink);
    ~AuditService();

    AuditService(const AuditService&)            = delete;
    AuditService& operator=(const AuditService&) = delete;

    // record
    //   event.sequence 는 여기서 부여된다 (호출자 값은 덮어쓴다).
    void record(AuditEvent event);

    // flush
    //   큐를 즉시 전달한다 (재시도 간격 무시). 전달이 끝날 때까지 기다리되,
    //   2 * delivery_timeout 안에 끝나지 않으면 kTimedOut 을 반환한다.
    //   큐가 비어 있으면 kDelivered.
    DeliveryStatus flush();

    [[nodiscard]] AuditStats    stats() const;
    [[nodiscard]] std::uint64_t dropped_events() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] const AuditConfig& config() const noexcept { return config_; }

private:
    struct Pending {
        AuditEvent        event;
        Clock::time_point enqueued_at;
    };

    boost::asio::awaitable<void> flush_loop();

    // 다음 flush 시각. 즉시 flush 해야 하면 now 이하, 대기할 것이 없으면 time_point::max().
    [[nodiscard]] Clock::time_point next_deadline(Clock::time_point now) const;

    // 큐 전체를 꺼내 sink 에 1회 전달한다. 워커 스레드(또는 워커 종료 후)에서만 호출.
    DeliveryStatus drain_once();

    // mutex_ 를 잡은 상태에서 호출. capacity 초과분을 앞에서부터 버린다.
    void enforce_capacity_locked();

    // 워커 스레드의 타이머 대기를 깨운다.
    void wake();

    const AuditConfig          config_;
    std::shared_ptr<AuditSink> sink_;

    // 큐 (mutex_ 보호)
    mutable std::mutex  mutex_;
    std::deque<Pending> buffer_;

    // 워커 스레드 전용 상태
    Clock::time_point retry_not_before_{};

    std::atomic<bool>          stopping_{false};
    std::uint64_t              sequence_{0};   // mutex_ 보호
    std::atomic<std::uint64_t> recorded_{0};
    std::atomic<std::uint64_t> filtered_{0};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> failed_deliveries_{0};

    // 선언 순서 = 초기화 순서. io_ctx_ 가 timer_/work_guard_ 보다 먼저여야 한다.
    boost::asio::io_context                                                   io_ctx_;
    boost::asio::steady_timer                                                 timer_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread                                                               worker_;
};
