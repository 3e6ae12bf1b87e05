// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

}  // namespace

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
spdlog::level::level_enum StructuredLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         echo_to_stdout)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        // 로그 디렉터리 생성
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        if (echo_to_stdout) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 100 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        // 로거 생성 (스레드 안전). 레지스트리에는 등록하지 않는다.
        logger_ = std::make_shared<spdlog::logger>("reqgate.audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));

        // 본문이 이미 JSON 이므로 접두어를 붙이지 않는다
        logger_->set_pattern("%v");

        // 매 로그마다 파일을 플러시하도록 설정
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("structured_logger: initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("structured_logger: cannot create log directory: ") + ex.what());
    }
}

// ---------------------------------------------------------------------------
// to_audit_json
//   {"event":"security_audit","sequence":N,"timestamp":"...","client_id":"...",
//    "endpoint":"...","severity":"high","outcome":"blocked",
//    "violations":[{"kind":"...","severity":"...","detail":"..."}]}
// ---------------------------------------------------------------------------
std::string StructuredLogger::to_audit_json(const AuditEvent& event) {
    std::ostringstream json;
    json << R"({"event":"security_audit","sequence":)" << event.sequence
         << R"(,"timestamp":")" << format_iso8601(event.timestamp)
         << R"(","client_id":")" << escape_json_string(event.client_id)
         << R"(","endpoint":")" << escape_json_string(event.endpoint)
         << R"(","severity":")" << severity_to_string(event.severity)
         << R"(","outcome":")" << audit_outcome_to_string(event.outcome)
         << R"(","violations":[)";

    for (std::size_t i = 0; i < event.violations.size(); ++i) {
        const auto& v = event.violations[i];
        if (i > 0) {
            json << ',';
        }
        json << R"({"kind":")" << violation_kind_to_string(v.kind)
             << R"(","severity":")" << severity_to_string(v.severity)
             << R"(","detail":")" << escape_json_string(v.detail) << R"("})";
    }

    json << "]}";
    return json.str();
}

// ---------------------------------------------------------------------------
// log_audit
// ---------------------------------------------------------------------------
void StructuredLogger::log_audit(const AuditEvent& event) {
    const LogLevel level = event.outcome == AuditOutcome::kBlocked ? LogLevel::kWarn : LogLevel::kInfo;
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }

    logger_->log(to_spdlog_level(level), to_audit_json(event));
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
