#pragma once

// ---------------------------------------------------------------------------
// validation_service.hpp
//
// 단일 요청에 대한 정책 검사 (크기 제한, 파라미터, 시그니처, 필수 헤더).
//
// [동작 원칙]
// - 모든 검사를 끝까지 수행한다. 첫 위반에서 멈추지 않는다.
//   호출자와 감사 로그가 전체 위반 목록을 볼 수 있어야 한다.
// - 위반 순서는 검사 순서를 따른다. 파라미터는 키 순서(ParameterMap 정렬)로 검사한다.
// - 잘못된 입력에 대해 예외를 던지지 않는다. 정책 위반은 반환값으로만 보고한다.
//
// [검사 순서]
//   1. content_length > max_request_size            → RequestTooLarge (High)
//   2. content 길이 > max_content_length             → ContentTooLarge (High)
//   3. 파라미터별:
//      - 이름 비어있음/과도한 길이/위험 문자          → InvalidParameterName (High)
//        (이 경우 해당 값은 더 검사하지 않는다)
//      - 값 길이 > max_parameter_length              → ParameterTooLong (Medium)
//      - 경로 탐색 패턴                              → PathTraversalSuspected (High)
//   4. content + 파라미터 값 SQL Injection 스캔       → SqlInjectionSuspected (Critical)
//   5. content + 파라미터 값 XSS 스캔                 → XssSuspected (Critical)
//   6. require_security_headers 인 경우:
//      - required_headers 중 누락된 항목              → MissingRequiredHeader (Low)
//      - User-Agent 가 비었거나 너무 긴 경우          → InvalidHeader (Low)
//
// [스레드 안전성]
// 생성 후 상태를 변경하지 않으므로 여러 스레드에서 동시에 validate() 호출 가능.
// ---------------------------------------------------------------------------

#include <span>
#include <vector>

#include "common/types.hpp"
#include "config/security_config.hpp"
#include "detection/detection_rules.hpp"

// ---------------------------------------------------------------------------
// evaluate_validity
//   위반 목록이 BlockingPolicy 기준으로 통과 가능한지 판정한다.
//   차단 위반이 하나도 없으면 true.
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_blocking(const SecurityViolation& violation,
                               const BlockingPolicy&    policy) noexcept;

[[nodiscard]] bool evaluate_validity(std::span<const SecurityViolation> violations,
                                     const BlockingPolicy&              policy) noexcept;

// ---------------------------------------------------------------------------
// ValidationService
// ---------------------------------------------------------------------------
class ValidationService {
public:
    explicit ValidationService(const SecurityConfig& config);
    ~ValidationService() = default;

    ValidationService(const ValidationService&)            = delete;
    ValidationService& operator=(const ValidationService&) = delete;

    // validate
    //   request 를 검사해 위반 목록을 반환한다. 위반이 없으면 빈 벡터.
    [[nodiscard]] std::vector<SecurityViolation> validate(const SecurityRequest& request) const;

private:
    void check_sizes(const SecurityRequest& request, std::vector<SecurityViolation>& out) const;
    void check_parameters(const SecurityRequest& request, std::vector<SecurityViolation>& out) const;
    void check_signatures(const SecurityRequest& request, std::vector<SecurityViolation>& out) const;
    void check_headers(const SecurityRequest& request, std::vector<SecurityViolation>& out) const;

    [[nodiscard]] bool is_valid_parameter_name(std::string_view name) const noexcept;

    SecurityConfig   config_;
    DetectionRuleSet rules_;
};
