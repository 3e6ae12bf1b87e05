// ---------------------------------------------------------------------------
// memory_audit_sink.cpp
// ---------------------------------------------------------------------------

#include "audit/memory_audit_sink.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

bool matches(const AuditEvent& event, const AuditEventFilter& filter) {
    if (filter.from && event.timestamp < *filter.from) {
        return false;
    }
    if (filter.to && event.timestamp > *filter.to) {
        return false;
    }
    if (filter.min_severity && event.severity < *filter.min_severity) {
        return false;
    }
    if (filter.client_id && event.client_id != *filter.client_id) {
        return false;
    }
    if (filter.kind) {
        const auto kind = *filter.kind;
        const bool has_kind = std::any_of(event.violations.begin(), event.violations.end(),
                                          [kind](const SecurityViolation& v) { return v.kind == kind; });
        if (!has_kind) {
            return false;
        }
    }
    return true;
}

}  // namespace

MemoryAuditSink::MemoryAuditSink(std::size_t max_events)
    : max_events_(max_events) {
    if (max_events_ == 0) {
        throw std::invalid_argument("memory_audit_sink: max_events must be positive");
    }
}

DeliveryStatus MemoryAuditSink::deliver(std::span<const AuditEvent> batch,
                                        std::chrono::milliseconds /*timeout*/) {
    std::lock_guard lock(mutex_);
    ++batches_;
    for (const auto& event : batch) {
        // 재전송된 이벤트 무시 (sequence 0 은 AuditService 를 거치지 않은 이벤트)
        if (event.sequence != 0 && event.sequence <= last_sequence_) {
            continue;
        }
        last_sequence_ = std::max(last_sequence_, event.sequence);
        events_.push_back(event);
    }
    while (events_.size() > max_events_) {
        events_.pop_front();
    }
    return DeliveryStatus::kDelivered;
}

std::vector<AuditEvent> MemoryAuditSink::query(const AuditEventFilter& filter) const {
    std::vector<AuditEvent> result;
    std::lock_guard lock(mutex_);
    for (auto it = events_.rbegin(); it != events_.rend() && result.size() < filter.limit; ++it) {
        if (matches(*it, filter)) {
            result.push_back(*it);
        }
    }
    return result;
}

std::vector<AuditEvent> MemoryAuditSink::events() const {
    std::lock_guard lock(mutex_);
    return {events_.begin(), events_.end()};
}

std::size_t MemoryAuditSink::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

std::size_t MemoryAuditSink::batches_received() const {
    std::lock_guard lock(mutex_);
    return batches_;
}
