// ---------------------------------------------------------------------------
// validation_service.cpp
//
// ValidationService 구현.
// detail 문자열에는 필드 이름과 길이만 넣는다. 요청 값 자체는 넣지 않는다
// (감사 로그에 공격 페이로드가 그대로 남지 않도록).
// ---------------------------------------------------------------------------

#include "validation/validation_service.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "validation/sanitizer.hpp"

namespace {

constexpr std::string_view kUserAgentHeader{"User-Agent"};

bool is_blank(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

}  // namespace

// ---------------------------------------------------------------------------
// 차단 판정
// ---------------------------------------------------------------------------
bool is_blocking(const SecurityViolation& violation, const BlockingPolicy& policy) noexcept {
    if (violation.kind == ViolationKind::kRateLimitExceeded && policy.rate_limit_blocks) {
        return true;
    }
    return violation.severity >= policy.min_blocking_severity;
}

bool evaluate_validity(std::span<const SecurityViolation> violations,
                       const BlockingPolicy&              policy) noexcept {
    return std::none_of(violations.begin(), violations.end(),
                        [&policy](const SecurityViolation& v) { return is_blocking(v, policy); });
}

// ---------------------------------------------------------------------------
// ValidationService
// ---------------------------------------------------------------------------
ValidationService::ValidationService(const SecurityConfig& config)
    : config_(config) {}

std::vector<SecurityViolation> ValidationService::validate(const SecurityRequest& request) const {
    std::vector<SecurityViolation> violations;

    check_sizes(request, violations);
    check_parameters(request, violations);
    check_signatures(request, violations);
    if (config_.require_security_headers) {
        check_headers(request, violations);
    }

    return violations;
}

void ValidationService::check_sizes(const SecurityRequest&          request,
                                    std::vector<SecurityViolation>& out) const {
    if (request.content_length > config_.max_request_size) {
        out.push_back(SecurityViolation{
            .kind     = ViolationKind::kRequestTooLarge,
            .detail   = fmt::format("declared content length {} exceeds limit {}",
                                    request.content_length, config_.max_request_size),
            .severity = Severity::kHigh,
        });
    }

    if (request.content.size() > config_.max_content_length) {
        out.push_back(SecurityViolation{
            .kind     = ViolationKind::kContentTooLarge,
            .detail   = fmt::format("content length {} exceeds limit {}",
                                    request.content.size(), config_.max_content_length),
            .severity = Severity::kHigh,
        });
    }
}

void ValidationService::check_parameters(const SecurityRequest&          request,
                                         std::vector<SecurityViolation>& out) const {
    for (const auto& [name, value] : request.parameters) {
        if (!is_valid_parameter_name(name)) {
            // 이름 자체가 잘못된 파라미터는 값 검사를 생략한다
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kInvalidParameterName,
                .detail   = fmt::format("invalid parameter name (length {})", name.size()),
                .severity = Severity::kHigh,
            });
            continue;
        }

        if (value.size() > config_.max_parameter_length) {
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kParameterTooLong,
                .detail   = fmt::format("parameter '{}' length {} exceeds limit {}",
                                        name, value.size(), config_.max_parameter_length),
                .severity = Severity::kMedium,
            });
        }

        if (rules_.contains_path_traversal(value)) {
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kPathTraversalSuspected,
                .detail   = fmt::format("path traversal pattern in parameter '{}'", name),
                .severity = Severity::kHigh,
            });
        }
    }
}

void ValidationService::check_signatures(const SecurityRequest&          request,
                                         std::vector<SecurityViolation>& out) const {
    // SQL 스캔을 먼저 모든 필드에 대해 수행하고, XSS 스캔을 그 다음에 수행한다
    if (!request.content.empty()) {
        if (const auto rule = rules_.first_sql_match(request.content)) {
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kSqlInjectionSuspected,
                .detail   = fmt::format("rule '{}' matched in content",
                                        DetectionRuleSet::rule_name(*rule)),
                .severity = Severity::kCritical,
            });
        }
    }
    for (const auto& [name, value] : request.parameters) {
        if (value.empty() || !is_valid_parameter_name(name)) {
            continue;
        }
        if (const auto rule = rules_.first_sql_match(value)) {
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kSqlInjectionSuspected,
                .detail   = fmt::format("rule '{}' matched in parameter '{}'",
                                        DetectionRuleSet::rule_name(*rule), name),
                .severity = Severity::kCritical,
            });
        }
    }

    if (!request.content.empty()) {
        if (const auto rule = rules_.first_xss_match(request.content)) {
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kXssSuspected,
                .detail   = fmt::format("rule '{}' matched in content",
                                        DetectionRuleSet::rule_name(*rule)),
                .severity = Severity::kCritical,
            });
        }
    }
    for (const auto& [name, value] : request.parameters) {
        if (value.empty() || !is_valid_parameter_name(name)) {
            continue;
        }
        if (const auto rule = rules_.first_xss_match(value)) {
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kXssSuspected,
                .detail   = fmt::format("rule '{}' matched in parameter '{}'",
                                        DetectionRuleSet::rule_name(*rule), name),
                .severity = Severity::kCritical,
            });
        }
    }
}

void ValidationService::check_headers(const SecurityRequest&          request,
                                      std::vector<SecurityViolation>& out) const {
    for (const auto& header : config_.required_headers) {
        if (request.headers.find(header) == request.headers.end()) {
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kMissingRequiredHeader,
                .detail   = fmt::format("missing required header '{}'", header),
                .severity = Severity::kLow,
            });
        }
    }

    const auto ua = request.headers.find(kUserAgentHeader);
    if (ua != request.headers.end()) {
        if (is_blank(ua->second)) {
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kInvalidHeader,
                .detail   = "User-Agent header is empty",
                .severity = Severity::kLow,
            });
        } else if (ua->second.size() > config_.max_user_agent_length) {
            out.push_back(SecurityViolation{
                .kind     = ViolationKind::kInvalidHeader,
                .detail   = fmt::format("User-Agent length {} exceeds limit {}",
                                        ua->second.size(), config_.max_user_agent_length),
                .severity = Severity::kLow,
            });
        }
    }
}

bool ValidationService::is_valid_parameter_name(std::string_view name) const noexcept {
    if (name.empty() || is_blank(name)) {
        return false;
    }
    if (name.size() > config_.max_parameter_name_length) {
        return false;
    }
    return !contains_dangerous_characters(name);
}
