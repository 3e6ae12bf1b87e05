// ---------------------------------------------------------------------------
// log_audit_sink.cpp
// ---------------------------------------------------------------------------

#include "audit/log_audit_sink.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

std::shared_ptr<StructuredLogger> make_logger(const LoggingConfig& config, bool echo_to_stdout) {
    const auto level = parse_log_level(config.level);
    if (!level.has_value()) {
        throw std::invalid_argument("log_audit_sink: unknown log level '" + config.level + "'");
    }
    return std::make_shared<StructuredLogger>(*level, config.audit_log_path, echo_to_stdout);
}

}  // namespace

LogAuditSink::LogAuditSink(std::shared_ptr<StructuredLogger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("log_audit_sink: logger must not be null");
    }
}

LogAuditSink::LogAuditSink(const LoggingConfig& config, bool echo_to_stdout)
    : logger_(make_logger(config, echo_to_stdout)) {}

DeliveryStatus LogAuditSink::deliver(std::span<const AuditEvent> batch,
                                     std::chrono::milliseconds    timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    try {
        for (const auto& event : batch) {
            if (std::chrono::steady_clock::now() > deadline) {
                return DeliveryStatus::kTimedOut;
            }
            logger_->log_audit(event);
        }
        logger_->flush();
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("log_audit_sink: write failed: {}", e.what());
        return DeliveryStatus::kFailed;
    }

    return DeliveryStatus::kDelivered;
}
