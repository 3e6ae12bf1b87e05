#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 레벨 타입 정의.
//
// [순환 의존성 방지 설계]
// - 이 헤더는 프로젝트 내부 헤더를 include 하지 않는다.
// - config_loader 가 logging.level 검사에 사용한다.
// ---------------------------------------------------------------------------

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// parse_log_level
//   "debug" | "info" | "warn" | "error" (대소문자 무관). 그 외는 nullopt.
[[nodiscard]] inline std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (const char c : text) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lowered == "debug")                       { return LogLevel::kDebug; }
    if (lowered == "info")                        { return LogLevel::kInfo; }
    if (lowered == "warn" || lowered == "warning") { return LogLevel::kWarn; }
    if (lowered == "error")                       { return LogLevel::kError; }
    return std::nullopt;
}
