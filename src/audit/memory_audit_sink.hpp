#pragma once

// ---------------------------------------------------------------------------
// memory_audit_sink.hpp
//
// 최근 감사 이벤트를 메모리에 보관하고 조회/보고서 생성을 지원하는 sink.
//
// [보관 정책]
// max_events 를 넘으면 가장 오래된 이벤트부터 버린다.
// 같은 sequence 가 다시 전달되면 (재전송) 무시한다.
// 중복 판정은 지금까지 받은 최대 sequence 하나로 한다. 따라서 배치는 sequence
// 오름차순으로 도착해야 한다. AuditService 는 sequence 를 큐 삽입과 같은 임계
// 구역에서 부여하고 실패한 배치를 큐 앞쪽에 되돌리므로 이 순서를 지킨다.
// sequence 는 AuditService 인스턴스마다 따로 증가하므로 sink 하나는 서비스 하나에만 연결한다.
//
// [스레드 안전성]
// deliver() 는 flush 스레드, query() 는 임의의 스레드에서 호출될 수 있다.
// 내부 mutex 로 보호한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "audit/audit_sink.hpp"

// ---------------------------------------------------------------------------
// AuditEventFilter
//   모든 조건은 AND. 비어있는 조건은 검사하지 않는다.
//   from/to 는 [from, to] 폐구간.
// ---------------------------------------------------------------------------
struct AuditEventFilter {
    std::optional<std::chrono::system_clock::time_point> from{};
    std::optional<std::chrono::system_clock::time_point> to{};
    std::optional<ViolationKind>                         kind{};
    std::optional<Severity>                              min_severity{};
    std::optional<std::string>                           client_id{};
    std::size_t                                          limit{100};
};

class MemoryAuditSink : public AuditSink {
public:
    explicit MemoryAuditSink(std::size_t max_events = 10000);
    ~MemoryAuditSink() override = default;

    [[nodiscard]] DeliveryStatus deliver(std::span<const AuditEvent> batch,
                                         std::chrono::milliseconds    timeout) override;

    // query
    //   filter 에 맞는 이벤트를 최신순으로 최대 filter.limit 개 반환한다.
    [[nodiscard]] std::vector<AuditEvent> query(const AuditEventFilter& filter) const;

    // events
    //   보관 중인 전체 이벤트 (오래된 순).
    [[nodiscard]] std::vector<AuditEvent> events() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t batches_received() const;

private:
    const std::size_t      max_events_;
    mutable std::mutex     mutex_;
    std::deque<AuditEvent> events_;
    std::uint64_t          last_sequence_{0};
    std::size_t            batches_{0};
};
