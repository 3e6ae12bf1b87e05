// ---------------------------------------------------------------------------
// security_middleware.cpp
// ---------------------------------------------------------------------------

#include "middleware/security_middleware.hpp"

#include <chrono>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "config/config_loader.hpp"

namespace {

// 응답 헤더 값
constexpr const char* kContentSecurityPolicy =
    "default-src 'self'; script-src 'self'; style-src 'self' 'unsafe-inline'; img-src 'self' data:";
constexpr const char* kPermissionsPolicy      = "geolocation=(), microphone=(), camera=()";
constexpr const char* kStrictTransportSecurity = "max-age=31536000; includeSubDomains";

const SecurityConfig& checked(const SecurityConfig& config) {
    if (auto valid = validate_config(config); !valid) {
        throw std::invalid_argument("security_middleware: invalid configuration: " + valid.error());
    }
    return config;
}

std::unique_ptr<RateLimiter> make_rate_limiter(const SecurityConfig& config) {
    if (!config.enable_rate_limiting) {
        return nullptr;
    }
    return std::make_unique<RateLimiter>(config.rate_limit);
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성자
// ---------------------------------------------------------------------------
SecurityMiddleware::SecurityMiddleware(const SecurityConfig& config, std::shared_ptr<AuditService> audit)
    : config_(checked(config))
    , validation_(config_)
    , rate_limiter_(make_rate_limiter(config_))
    , audit_(std::move(audit))
{
    if (!audit_) {
        throw std::invalid_argument("security_middleware: audit service must not be null");
    }
    spdlog::info("security_middleware: initialized (rate_limiting={}, security_headers={}, "
                 "min_blocking_severity={})",
                 config_.enable_rate_limiting, config_.add_security_headers,
                 severity_to_string(config_.blocking.min_blocking_severity));
}

SecurityMiddleware::SecurityMiddleware(const SecurityConfig& config, std::shared_ptr<AuditSink> sink)
    : SecurityMiddleware(checked(config), std::make_shared<AuditService>(config.audit, std::move(sink)))
{}

// ---------------------------------------------------------------------------
// validate_request
// ---------------------------------------------------------------------------
SecurityValidationResult SecurityMiddleware::validate_request(const SecurityRequest& request) {
    SecurityValidationResult result{};

    // 1. rate limit
    bool rate_limited = false;
    if (rate_limiter_) {
        const auto decision = rate_limiter_->check(request.client_id);
        if (!decision.allowed) {
            rate_limited = true;
            result.violations.push_back(SecurityViolation{
                .kind     = ViolationKind::kRateLimitExceeded,
                .detail   = fmt::format("{} requests in window of {}ms, limit {}, retry after {}ms",
                                        decision.current_count, config_.rate_limit.window.count(),
                                        decision.limit, decision.retry_after.count()),
                .severity = Severity::kMedium,
            });
        }
    }

    // 2. 요청 검사
    auto violations = validation_.validate(request);
    result.violations.insert(result.violations.end(),
                             std::make_move_iterator(violations.begin()),
                             std::make_move_iterator(violations.end()));

    result.is_valid = evaluate_validity(result.violations, config_.blocking);

    // 3. 응답 헤더
    result.security_headers = generate_security_headers();

    // 4. 감사 기록 (관찰 전용)
    AuditEvent event{
        .timestamp  = std::chrono::system_clock::now(),
        .client_id  = request.client_id,
        .endpoint   = request.endpoint,
        .severity   = highest_severity(result.violations),
        .violations = result.violations,
        .outcome    = result.is_valid ? AuditOutcome::kAllowed : AuditOutcome::kBlocked,
        .sequence   = 0,
    };
    audit_->record(std::move(event));

    stats_.on_request(!result.is_valid, result.is_valid && !result.violations.empty(), rate_limited);

    if (!result.is_valid) {
        spdlog::warn("security_middleware: blocked request to '{}' ({} violation(s), highest={})",
                     request.endpoint, result.violations.size(),
                     severity_to_string(highest_severity(result.violations)));
    } else if (!result.violations.empty()) {
        spdlog::debug("security_middleware: allowed request to '{}' with {} advisory violation(s)",
                      request.endpoint, result.violations.size());
    }

    return result;
}

// ---------------------------------------------------------------------------
// generate_security_headers
// ---------------------------------------------------------------------------
std::unordered_map<std::string, std::string> SecurityMiddleware::generate_security_headers() const {
    std::unordered_map<std::string, std::string> headers;
    if (!config_.add_security_headers) {
        return headers;
    }

    headers.emplace("Content-Security-Policy", kContentSecurityPolicy);
    headers.emplace("X-Frame-Options", "DENY");
    headers.emplace("X-Content-Type-Options", "nosniff");
    headers.emplace("X-XSS-Protection", "1; mode=block");
    headers.emplace("Referrer-Policy", "strict-origin-when-cross-origin");
    headers.emplace("Permissions-Policy", kPermissionsPolicy);

    if (config_.use_https_only) {
        headers.emplace("Strict-Transport-Security", kStrictTransportSecurity);
    }

    return headers;
}

std::string SecurityMiddleware::sanitize_input(std::string_view           input,
                                               const SanitizationOptions& options) const {
    return ::sanitize_input(input, options);
}
