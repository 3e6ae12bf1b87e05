#pragma once

// ---------------------------------------------------------------------------
// audit_report.hpp
//
// 감사 이벤트 목록으로부터 기간 요약 보고서를 만든다.
// 순수 함수이며 입력을 변경하지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <map>
#include <span>
#include <utility>
#include <vector>

#include "audit/audit_types.hpp"

// ---------------------------------------------------------------------------
// AuditReport
//   [start, end] 구간에 속한 이벤트만 집계한다.
//
//   violations_by_kind : 위반 단위 집계 (이벤트 하나에 위반 여러 개 가능)
//   high_severity_events: severity >= kHigh 인 이벤트 (오래된 순)
//   top_violation_kinds : 빈도 내림차순 상위 10개. 빈도가 같으면 enum 순서.
// ---------------------------------------------------------------------------
struct AuditReport {
    std::chrono::system_clock::time_point start{};
    std::chrono::system_clock::time_point end{};
    std::chrono::system_clock::time_point generated_at{};

    std::size_t                             total_events{0};
    std::size_t                             blocked_events{0};
    std::map<Severity, std::size_t>         events_by_severity{};
    std::map<ViolationKind, std::size_t>    violations_by_kind{};
    std::vector<AuditEvent>                 high_severity_events{};
    std::vector<std::pair<ViolationKind, std::size_t>> top_violation_kinds{};
};

inline constexpr std::size_t kTopViolationKinds = 10;

[[nodiscard]] AuditReport build_audit_report(std::span<const AuditEvent>           events,
                                             std::chrono::system_clock::time_point start,
                                             std::chrono::system_clock::time_point end);
