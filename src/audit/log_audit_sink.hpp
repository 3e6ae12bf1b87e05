#pragma once

// ---------------------------------------------------------------------------
// log_audit_sink.hpp
//
// StructuredLogger 를 통해 감사 이벤트를 JSON 라인으로 기록하는 sink.
//
// [타임아웃]
// 이벤트 사이마다 경과 시간을 확인하고, timeout 을 넘기면 남은 이벤트를 쓰지 않고
// kTimedOut 을 반환한다. 이미 쓴 이벤트는 재전송 시 중복 기록된다
// (sequence 로 구분 가능).
// ---------------------------------------------------------------------------

#include <memory>

#include "audit/audit_sink.hpp"
#include "config/security_config.hpp"
#include "logger/structured_logger.hpp"

class LogAuditSink : public AuditSink {
public:
    explicit LogAuditSink(std::shared_ptr<StructuredLogger> logger);

    // LoggingConfig 로부터 StructuredLogger 를 만든다.
    // level 이 잘못되었으면 std::invalid_argument, 싱크 생성 실패 시 std::runtime_error.
    explicit LogAuditSink(const LoggingConfig& config, bool echo_to_stdout = true);

    ~LogAuditSink() override = default;

    [[nodiscard]] DeliveryStatus deliver(std::span<const AuditEvent> batch,
                                         std::chrono::milliseconds    timeout) override;

    [[nodiscard]] const std::shared_ptr<StructuredLogger>& logger() const noexcept { return logger_; }

private:
    std::shared_ptr<StructuredLogger> logger_;
};
