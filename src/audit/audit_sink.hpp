#pragma once

// ---------------------------------------------------------------------------
// audit_sink.hpp
//
// 감사 이벤트 전달 대상 추상 인터페이스.
//
// [계약]
// - deliver() 는 AuditService 의 flush 스레드에서만 호출된다 (동시 호출 없음).
// - timeout 을 넘기면 kTimedOut 을 반환해야 한다. AuditService 는 kDelivered 가
//   아닌 모든 결과를 실패로 보고 같은 배치를 다음 flush 에서 다시 보낸다.
//   따라서 sink 는 재전송(sequence 중복)을 견뎌야 한다.
// - deliver() 는 예외를 던지지 않아야 한다. 던진 예외는 kFailed 로 처리된다.
// ---------------------------------------------------------------------------

#include "audit/audit_types.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>

enum class DeliveryStatus : std::uint8_t {
    kDelivered = 0,
    kFailed    = 1,
    kTimedOut  = 2,
};

inline constexpr std::string_view delivery_status_to_string(DeliveryStatus status) noexcept {
    switch (status) {
        case DeliveryStatus::kDelivered: return "delivered";
        case DeliveryStatus::kFailed:    return "failed";
        case DeliveryStatus::kTimedOut:  return "timed_out";
    }
    return "unknown";
}

class AuditSink {
public:
    virtual ~AuditSink() = default;

    // deliver
    //   batch 는 오래된 이벤트부터 정렬되어 있다.
    [[nodiscard]] virtual DeliveryStatus deliver(std::span<const AuditEvent> batch,
                                                 std::chrono::milliseconds    timeout) = 0;
};
