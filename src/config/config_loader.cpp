// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 SecurityConfig 구조체로 파싱하고 불변식을 검사한다.
//
// [설계 원칙]
// - All-or-nothing: 어느 섹션이든 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - 타입 불일치(예: max_request_size: "big")는 기본값 대체가 아니라 실패로 처리한다.
//   잘못 쓴 제한값이 조용히 기본값으로 바뀌면 운영자가 오류를 알아채지 못한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [duration 표기]
// "500ms", "30s", "5m", "1h" 또는 단위 없는 정수(초).
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "logger/log_types.hpp"

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 노드가 있으면 T 로 변환, 없으면 fallback.
// 변환 실패 시 YAML::TypedBadConversion 이 그대로 전파된다 (섹션 단위 catch).
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] T read_scalar(const YAML::Node& node, const T& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<T>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 양의 정수 읽기. 0 이하이면 std::invalid_argument.
// unsigned 변환에서 음수가 큰 양수로 바뀌는 것을 막기 위해 int64 로 먼저 읽는다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::int64_t read_positive(const YAML::Node& node,
                                         std::string_view   key,
                                         std::int64_t       fallback) {
    const auto value = read_scalar<std::int64_t>(node, fallback);
    if (value <= 0) {
        throw std::invalid_argument(fmt::format("'{}' must be positive, got {}", key, value));
    }
    return value;
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node&              node,
                                                            const std::vector<std::string>& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsSequence()) {
        throw std::invalid_argument("expected a sequence of strings");
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (const auto& item : node) {
        result.push_back(item.as<std::string>());
    }
    return result;
}

[[nodiscard]] std::chrono::milliseconds read_duration(const YAML::Node&         node,
                                                      std::string_view          key,
                                                      std::chrono::milliseconds fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    const auto raw    = node.as<std::string>();
    const auto parsed = parse_duration(raw);
    if (!parsed.has_value()) {
        throw std::invalid_argument(fmt::format("'{}' has invalid duration '{}'", key, raw));
    }
    return *parsed;
}

[[nodiscard]] Severity read_severity(const YAML::Node& node, std::string_view key, Severity fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    const auto raw    = node.as<std::string>();
    const auto parsed = parse_severity(raw);
    if (!parsed.has_value()) {
        throw std::invalid_argument(fmt::format("'{}' has unknown severity '{}'", key, raw));
    }
    return *parsed;
}

// ---------------------------------------------------------------------------
// 섹션 파서
// ---------------------------------------------------------------------------
void parse_limits(const YAML::Node& node, SecurityConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.max_request_size = read_positive(node["max_request_size"], "max_request_size",
                                         cfg.max_request_size);
    cfg.max_content_length = static_cast<std::size_t>(read_positive(
        node["max_content_length"], "max_content_length",
        static_cast<std::int64_t>(cfg.max_content_length)));
    cfg.max_parameter_length = static_cast<std::size_t>(read_positive(
        node["max_parameter_length"], "max_parameter_length",
        static_cast<std::int64_t>(cfg.max_parameter_length)));
    cfg.max_parameter_name_length = static_cast<std::size_t>(read_positive(
        node["max_parameter_name_length"], "max_parameter_name_length",
        static_cast<std::int64_t>(cfg.max_parameter_name_length)));
    cfg.max_user_agent_length = static_cast<std::size_t>(read_positive(
        node["max_user_agent_length"], "max_user_agent_length",
        static_cast<std::int64_t>(cfg.max_user_agent_length)));
}

void parse_headers(const YAML::Node& node, SecurityConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.add_security_headers     = read_scalar(node["add_security_headers"], cfg.add_security_headers);
    cfg.require_security_headers = read_scalar(node["require_security_headers"],
                                               cfg.require_security_headers);
    cfg.required_headers         = read_string_sequence(node["required_headers"], cfg.required_headers);
    cfg.use_https_only           = read_scalar(node["use_https_only"], cfg.use_https_only);
}

void parse_rate_limit(const YAML::Node& node, SecurityConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.enable_rate_limiting = read_scalar(node["enabled"], cfg.enable_rate_limiting);
    cfg.rate_limit.max_requests = static_cast<std::size_t>(read_positive(
        node["max_requests"], "rate_limit.max_requests",
        static_cast<std::int64_t>(cfg.rate_limit.max_requests)));
    cfg.rate_limit.window = read_duration(node["window"], "rate_limit.window", cfg.rate_limit.window);
    cfg.rate_limit.idle_eviction = read_duration(node["idle_eviction"], "rate_limit.idle_eviction",
                                                 cfg.rate_limit.idle_eviction);
}

void parse_blocking(const YAML::Node& node, SecurityConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.blocking.min_blocking_severity = read_severity(
        node["min_blocking_severity"], "blocking.min_blocking_severity",
        cfg.blocking.min_blocking_severity);
    cfg.blocking.rate_limit_blocks = read_scalar(node["rate_limit_blocks"], cfg.blocking.rate_limit_blocks);
}

void parse_audit(const YAML::Node& node, SecurityConfig& cfg) {
    if (!node) {
        return;
    }
    auto& audit = cfg.audit;
    audit.minimum_log_level = read_severity(node["minimum_log_level"], "audit.minimum_log_level",
                                            audit.minimum_log_level);
    audit.enable_buffering = read_scalar(node["enable_buffering"], audit.enable_buffering);
    audit.flush_threshold = static_cast<std::size_t>(read_positive(
        node["flush_threshold"], "audit.flush_threshold",
        static_cast<std::int64_t>(audit.flush_threshold)));
    audit.max_buffer_age = read_duration(node["max_buffer_age"], "audit.max_buffer_age",
                                         audit.max_buffer_age);
    audit.buffer_capacity = static_cast<std::size_t>(read_positive(
        node["buffer_capacity"], "audit.buffer_capacity",
        static_cast<std::int64_t>(audit.buffer_capacity)));
    audit.delivery_timeout = read_duration(node["delivery_timeout"], "audit.delivery_timeout",
                                           audit.delivery_timeout);
}

void parse_logging(const YAML::Node& node, SecurityConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.logging.level          = read_scalar(node["level"], cfg.logging.level);
    cfg.logging.audit_log_path = read_scalar(node["audit_log_path"], cfg.logging.audit_log_path);
}

// ---------------------------------------------------------------------------
// parse_root
//   섹션별로 파싱하며, 실패한 섹션 이름을 오류 메시지에 포함한다.
// ---------------------------------------------------------------------------
std::expected<SecurityConfig, std::string> parse_root(const YAML::Node& root, std::string_view origin) {
    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", origin);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    SecurityConfig cfg{};

    using SectionParser = void (*)(const YAML::Node&, SecurityConfig&);
    const std::pair<const char*, SectionParser> sections[] = {
        {"limits",     parse_limits},
        {"headers",    parse_headers},
        {"rate_limit", parse_rate_limit},
        {"blocking",   parse_blocking},
        {"audit",      parse_audit},
        {"logging",    parse_logging},
    };

    for (const auto& [name, parser] : sections) {
        try {
            const YAML::Node section = root[name];
            if (section && !section.IsNull() && !section.IsMap()) {
                throw std::invalid_argument("section is not a map");
            }
            parser(section, cfg);
        } catch (const YAML::Exception& e) {
            const std::string err = fmt::format(
                "config_loader: error parsing '{}' section in '{}': {}", name, origin, e.what());
            spdlog::error("{}", err);
            return std::unexpected(err);
        } catch (const std::invalid_argument& e) {
            const std::string err = fmt::format(
                "config_loader: invalid value in '{}' section in '{}': {}", name, origin, e.what());
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
    }

    if (auto valid = validate_config(cfg); !valid) {
        const std::string err = fmt::format("config_loader: '{}': {}", origin, valid.error());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// validate_config
// ---------------------------------------------------------------------------
std::expected<void, std::string> validate_config(const SecurityConfig& config) {
    if (config.max_request_size <= 0) {
        return std::unexpected(std::string{"max_request_size must be positive"});
    }
    if (config.max_content_length == 0) {
        return std::unexpected(std::string{"max_content_length must be positive"});
    }
    if (config.max_parameter_length == 0) {
        return std::unexpected(std::string{"max_parameter_length must be positive"});
    }
    if (config.max_parameter_name_length == 0) {
        return std::unexpected(std::string{"max_parameter_name_length must be positive"});
    }
    if (config.max_user_agent_length == 0) {
        return std::unexpected(std::string{"max_user_agent_length must be positive"});
    }
    // 추가하지 않는 헤더를 요구할 수는 없다
    if (config.require_security_headers && !config.add_security_headers) {
        return std::unexpected(std::string{
            "require_security_headers requires add_security_headers to be enabled"});
    }

    const auto& rl = config.rate_limit;
    if (rl.max_requests == 0) {
        return std::unexpected(std::string{"rate_limit.max_requests must be positive"});
    }
    if (rl.window.count() <= 0) {
        return std::unexpected(std::string{"rate_limit.window must be positive"});
    }
    if (rl.idle_eviction < rl.window) {
        return std::unexpected(std::string{"rate_limit.idle_eviction must not be shorter than window"});
    }

    const auto& audit = config.audit;
    if (audit.flush_threshold == 0) {
        return std::unexpected(std::string{"audit.flush_threshold must be positive"});
    }
    if (audit.buffer_capacity < audit.flush_threshold) {
        return std::unexpected(std::string{"audit.buffer_capacity must be >= audit.flush_threshold"});
    }
    if (audit.max_buffer_age.count() <= 0) {
        return std::unexpected(std::string{"audit.max_buffer_age must be positive"});
    }
    if (audit.delivery_timeout.count() <= 0) {
        return std::unexpected(std::string{"audit.delivery_timeout must be positive"});
    }

    if (!parse_log_level(config.logging.level).has_value()) {
        return std::unexpected(fmt::format("logging.level '{}' is not one of debug|info|warn|error",
                                           config.logging.level));
    }
    if (config.logging.audit_log_path.empty()) {
        return std::unexpected(std::string{"logging.audit_log_path must not be empty"});
    }

    return {};
}

// ---------------------------------------------------------------------------
// parse_severity
// ---------------------------------------------------------------------------
std::optional<Severity> parse_severity(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (const char c : text) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lowered == "low")      { return Severity::kLow; }
    if (lowered == "medium")   { return Severity::kMedium; }
    if (lowered == "high")     { return Severity::kHigh; }
    if (lowered == "critical") { return Severity::kCritical; }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// parse_duration
//   숫자 부분은 std::from_chars 로 파싱, 나머지를 단위로 해석한다.
// ---------------------------------------------------------------------------
std::optional<std::chrono::milliseconds> parse_duration(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::int64_t value{0};
    const char*  begin = text.data();
    const char*  end   = text.data() + text.size();

    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || value < 0) {
        return std::nullopt;
    }

    const std::string_view unit{ptr, static_cast<std::size_t>(end - ptr)};
    std::int64_t ms_per_unit = 0;
    if (unit.empty() || unit == "s") {
        ms_per_unit = 1000;
    } else if (unit == "ms") {
        ms_per_unit = 1;
    } else if (unit == "m") {
        ms_per_unit = 60 * 1000;
    } else if (unit == "h") {
        ms_per_unit = 60 * 60 * 1000;
    } else {
        return std::nullopt;
    }

    // steady_clock(나노초) 시각 연산에 더해도 넘치지 않는 범위만 허용한다
    constexpr std::int64_t kMaxMilliseconds =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max()).count();
    if (value > kMaxMilliseconds / ms_per_unit) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{value * ms_per_unit};
}

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<SecurityConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading security config from '{}'", canonical_path.string());

    // 2. YAML 파일 로드
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    auto result = parse_root(root, canonical_path.string());
    if (result) {
        spdlog::info(
            "config_loader: config loaded: max_request_size={}, rate_limiting={}, "
            "audit_buffering={}",
            result->max_request_size, result->enable_rate_limiting,
            result->audit.enable_buffering);
    }
    return result;
}

std::expected<SecurityConfig, std::string>
ConfigLoader::load_from_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML error: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return parse_root(root, "<string>");
}
