// ---------------------------------------------------------------------------
// audit_report.cpp
// ---------------------------------------------------------------------------

#include "audit/audit_report.hpp"

#include <algorithm>

AuditReport build_audit_report(std::span<const AuditEvent>           events,
                               std::chrono::system_clock::time_point start,
                               std::chrono::system_clock::time_point end) {
    AuditReport report{};
    report.start        = start;
    report.end          = end;
    report.generated_at = std::chrono::system_clock::now();

    for (const auto& event : events) {
        if (event.timestamp < start || event.timestamp > end) {
            continue;
        }

        ++report.total_events;
        ++report.events_by_severity[event.severity];
        if (event.outcome == AuditOutcome::kBlocked) {
            ++report.blocked_events;
        }
        for (const auto& v : event.violations) {
            ++report.violations_by_kind[v.kind];
        }
        if (event.severity >= Severity::kHigh) {
            report.high_severity_events.push_back(event);
        }
    }

    std::sort(report.high_severity_events.begin(), report.high_severity_events.end(),
              [](const AuditEvent& a, const AuditEvent& b) {
                  if (a.timestamp != b.timestamp) {
                      return a.timestamp < b.timestamp;
                  }
                  return a.sequence < b.sequence;
              });

    report.top_violation_kinds.assign(report.violations_by_kind.begin(),
                                      report.violations_by_kind.end());
    // map 순회 순서가 enum 순서이므로 stable_sort 로 동률 순서를 유지한다
    std::stable_sort(report.top_violation_kinds.begin(), report.top_violation_kinds.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (report.top_violation_kinds.size() > kTopViolationKinds) {
        report.top_violation_kinds.resize(kTopViolationKinds);
    }

    return report;
}
