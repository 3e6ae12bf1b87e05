#pragma once

// ---------------------------------------------------------------------------
// types.hpp
//
// 미들웨어 전 레이어가 공유하는 요청/위반/결과 타입 정의.
//
// [순환 의존성 방지]
// - 이 헤더는 프로젝트 내부 헤더를 include 하지 않는다.
// - detection / validation / ratelimit / audit / middleware 레이어는
//   이 헤더를 단방향으로만 참조한다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// Severity
//   위반/감사 이벤트의 심각도. 값이 클수록 심각하다.
//   비교 연산(<, >=)으로 필터링하므로 순서를 바꾸지 말 것.
// ---------------------------------------------------------------------------
enum class Severity : std::uint8_t {
    kLow      = 0,
    kMedium   = 1,
    kHigh     = 2,
    kCritical = 3,
};

// ---------------------------------------------------------------------------
// ViolationKind
//   검증 단계에서 생성되는 위반 종류 (닫힌 집합).
// ---------------------------------------------------------------------------
enum class ViolationKind : std::uint8_t {
    kRequestTooLarge        = 0,
    kContentTooLarge        = 1,
    kParameterTooLong       = 2,
    kSqlInjectionSuspected  = 3,
    kXssSuspected           = 4,
    kMissingRequiredHeader  = 5,
    kRateLimitExceeded      = 6,
    kInvalidParameterName   = 7,
    kPathTraversalSuspected = 8,
    kInvalidHeader          = 9,
};

inline constexpr std::string_view severity_to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::kLow:      return "low";
        case Severity::kMedium:   return "medium";
        case Severity::kHigh:     return "high";
        case Severity::kCritical: return "critical";
    }
    return "unknown";
}

inline constexpr std::string_view violation_kind_to_string(ViolationKind kind) noexcept {
    switch (kind) {
        case ViolationKind::kRequestTooLarge:        return "RequestTooLarge";
        case ViolationKind::kContentTooLarge:        return "ContentTooLarge";
        case ViolationKind::kParameterTooLong:       return "ParameterTooLong";
        case ViolationKind::kSqlInjectionSuspected:  return "SqlInjectionSuspected";
        case ViolationKind::kXssSuspected:           return "XssSuspected";
        case ViolationKind::kMissingRequiredHeader:  return "MissingRequiredHeader";
        case ViolationKind::kRateLimitExceeded:      return "RateLimitExceeded";
        case ViolationKind::kInvalidParameterName:   return "InvalidParameterName";
        case ViolationKind::kPathTraversalSuspected: return "PathTraversalSuspected";
        case ViolationKind::kInvalidHeader:          return "InvalidHeader";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// CaseInsensitiveLess
//   HTTP 헤더 이름 비교용. "content-type" 과 "Content-Type" 은 같은 키.
// ---------------------------------------------------------------------------
struct CaseInsensitiveLess {
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
        return std::lexicographical_compare(
            lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
            [](unsigned char a, unsigned char b) {
                return std::tolower(a) < std::tolower(b);
            });
    }
};

// 헤더 맵: 이름 대소문자 무관, 같은 이름에 다시 쓰면 마지막 값이 남는다.
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// 파라미터 맵: 키 순서가 고정되어야 같은 요청에 대해 같은 위반 순서가 나온다.
using ParameterMap = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// SecurityRequest
//   검증 호출 1회분의 입력. 검증 중에는 변경하지 않는다.
//   client_id 는 신뢰하지 않는 문자열이며 rate limit 버킷/감사 귀속에만 쓴다.
// ---------------------------------------------------------------------------
struct SecurityRequest {
    std::string   endpoint{};
    std::string   client_id{};
    std::int64_t  content_length{0};   // 선언된 본문 크기 (바이트)
    std::string   content{};
    HeaderMap     headers{};
    ParameterMap  parameters{};
};

// ---------------------------------------------------------------------------
// SecurityViolation
//   단일 정책 위반. 검증 호출마다 새로 만들고 이후 변경하지 않는다.
//   detail 은 감사 로그용이며 클라이언트 응답에 그대로 노출하지 말 것.
// ---------------------------------------------------------------------------
struct SecurityViolation {
    ViolationKind kind{ViolationKind::kRequestTooLarge};
    std::string   detail{};
    Severity      severity{Severity::kLow};

    friend bool operator==(const SecurityViolation&, const SecurityViolation&) = default;
};

// ---------------------------------------------------------------------------
// SecurityValidationResult
//   validate_request() 의 집계 결과.
//   is_valid == false 이면 차단 위반이 하나 이상 존재한다.
//   security_headers 는 호출자가 응답에 병합해야 한다.
// ---------------------------------------------------------------------------
struct SecurityValidationResult {
    bool                                         is_valid{true};
    std::vector<SecurityViolation>               violations{};
    std::unordered_map<std::string, std::string> security_headers{};

    [[nodiscard]] bool has_violation(ViolationKind kind) const noexcept {
        return std::any_of(violations.begin(), violations.end(),
                           [kind](const SecurityViolation& v) { return v.kind == kind; });
    }
};
