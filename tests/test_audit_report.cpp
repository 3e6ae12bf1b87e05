// ---------------------------------------------------------------------------
// test_audit_report.cpp
//
// build_audit_report() 및 MemoryAuditSink 조회 단위 테스트.
//
// [테스트 범위]
// - 전체/차단 이벤트 집계, 심각도별/위반 종류별 집계
// - [start, end] 폐구간 필터링
// - high_severity_events 시간순 정렬
// - top_violation_kinds 빈도 내림차순, 동률은 enum 순서, 최대 10개
// - MemoryAuditSink: 최신순 조회, 필터 조합, limit, 재전송 무시, max_events
// ---------------------------------------------------------------------------

#include "audit/audit_report.hpp"
#include "audit/memory_audit_sink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

const auto kBase = std::chrono::system_clock::time_point{} + std::chrono::hours{24 * 365 * 50};

AuditEvent make_event(std::chrono::seconds offset,
                      Severity severity,
                      AuditOutcome outcome,
                      std::vector<ViolationKind> kinds,
                      std::uint64_t sequence = 0,
                      std::string client_id = "c1") {
    AuditEvent event;
    event.timestamp = kBase + offset;
    event.client_id = std::move(client_id);
    event.endpoint  = "/api";
    event.severity  = severity;
    event.outcome   = outcome;
    event.sequence  = sequence;
    for (const auto kind : kinds) {
        event.violations.push_back(SecurityViolation{.kind = kind, .detail = "x", .severity = severity});
    }
    return event;
}

std::vector<AuditEvent> sample_events() {
    return {
        make_event(0s,  Severity::kLow,      AuditOutcome::kAllowed, {}, 1),
        make_event(10s, Severity::kCritical, AuditOutcome::kBlocked,
                   {ViolationKind::kSqlInjectionSuspected, ViolationKind::kXssSuspected}, 2),
        make_event(20s, Severity::kMedium,   AuditOutcome::kAllowed, {ViolationKind::kRateLimitExceeded}, 3),
        make_event(5s,  Severity::kHigh,     AuditOutcome::kBlocked, {ViolationKind::kSqlInjectionSuspected}, 4),
        make_event(30s, Severity::kMedium,   AuditOutcome::kAllowed, {ViolationKind::kParameterTooLong}, 5),
    };
}

}  // namespace

// ---------------------------------------------------------------------------
// AuditReport
// ---------------------------------------------------------------------------
TEST(AuditReport, Totals_CountedOverWholeRange) {
    const auto events = sample_events();
    const auto report = build_audit_report(events, kBase, kBase + 30s);

    EXPECT_EQ(report.total_events, 5u);
    EXPECT_EQ(report.blocked_events, 2u);
    EXPECT_EQ(report.events_by_severity.at(Severity::kLow), 1u);
    EXPECT_EQ(report.events_by_severity.at(Severity::kMedium), 2u);
    EXPECT_EQ(report.events_by_severity.at(Severity::kHigh), 1u);
    EXPECT_EQ(report.events_by_severity.at(Severity::kCritical), 1u);

    EXPECT_EQ(report.violations_by_kind.at(ViolationKind::kSqlInjectionSuspected), 2u)
        << "violations are counted per violation, not per event";
    EXPECT_EQ(report.violations_by_kind.at(ViolationKind::kXssSuspected), 1u);
    EXPECT_EQ(report.violations_by_kind.count(ViolationKind::kRequestTooLarge), 0u);
}

TEST(AuditReport, RangeIsInclusiveAndFilters) {
    const auto events = sample_events();
    const auto report = build_audit_report(events, kBase + 5s, kBase + 20s);

    EXPECT_EQ(report.total_events, 3u) << "events at 5s, 10s and 20s fall inside [5s, 20s]";
    EXPECT_EQ(report.blocked_events, 2u);
    EXPECT_EQ(report.events_by_severity.count(Severity::kLow), 0u);
    EXPECT_EQ(report.start, kBase + 5s);
    EXPECT_EQ(report.end, kBase + 20s);
}

TEST(AuditReport, EmptyInput_EmptyReport) {
    const std::vector<AuditEvent> events;
    const auto report = build_audit_report(events, kBase, kBase + 1h);

    EXPECT_EQ(report.total_events, 0u);
    EXPECT_TRUE(report.violations_by_kind.empty());
    EXPECT_TRUE(report.high_severity_events.empty());
    EXPECT_TRUE(report.top_violation_kinds.empty());
}

TEST(AuditReport, HighSeverityEvents_SortedByTime) {
    const auto events = sample_events();
    const auto report = build_audit_report(events, kBase, kBase + 30s);

    ASSERT_EQ(report.high_severity_events.size(), 2u);
    EXPECT_EQ(report.high_severity_events[0].sequence, 4u) << "5s event comes before 10s event";
    EXPECT_EQ(report.high_severity_events[1].sequence, 2u);
}

TEST(AuditReport, TopViolationKinds_ByCountThenEnumOrder) {
    const auto events = sample_events();
    const auto report = build_audit_report(events, kBase, kBase + 30s);

    ASSERT_EQ(report.top_violation_kinds.size(), 4u);
    EXPECT_EQ(report.top_violation_kinds[0].first, ViolationKind::kSqlInjectionSuspected);
    EXPECT_EQ(report.top_violation_kinds[0].second, 2u);
    // 동률(1회)은 enum 순서: ParameterTooLong(2) < Xss(4) < RateLimit(6)
    EXPECT_EQ(report.top_violation_kinds[1].first, ViolationKind::kParameterTooLong);
    EXPECT_EQ(report.top_violation_kinds[2].first, ViolationKind::kXssSuspected);
    EXPECT_EQ(report.top_violation_kinds[3].first, ViolationKind::kRateLimitExceeded);
}

TEST(AuditReport, TopViolationKinds_CappedAtTen) {
    std::vector<ViolationKind> all_kinds;
    for (int k = 0; k <= static_cast<int>(ViolationKind::kInvalidHeader); ++k) {
        all_kinds.push_back(static_cast<ViolationKind>(k));
    }
    std::vector<AuditEvent> events{make_event(0s, Severity::kHigh, AuditOutcome::kBlocked, all_kinds)};

    const auto report = build_audit_report(events, kBase, kBase);
    EXPECT_EQ(report.violations_by_kind.size(), all_kinds.size());
    EXPECT_LE(report.top_violation_kinds.size(), kTopViolationKinds);
}

// ---------------------------------------------------------------------------
// MemoryAuditSink
// ---------------------------------------------------------------------------
TEST(MemoryAuditSink, Query_NewestFirstWithLimit) {
    MemoryAuditSink sink;
    const auto events = sample_events();
    ASSERT_EQ(sink.deliver(std::span<const AuditEvent>(events.data(), 3), 1s), DeliveryStatus::kDelivered);

    AuditEventFilter filter;
    filter.limit = 2;
    const auto result = sink.query(filter);

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].sequence, 3u);
    EXPECT_EQ(result[1].sequence, 2u);
}

TEST(MemoryAuditSink, Query_FiltersCombineWithAnd) {
    MemoryAuditSink sink;
    auto events = sample_events();
    events.push_back(make_event(40s, Severity::kCritical, AuditOutcome::kBlocked,
                                {ViolationKind::kSqlInjectionSuspected}, 6, "c2"));
    ASSERT_EQ(sink.deliver(events, 1s), DeliveryStatus::kDelivered);

    AuditEventFilter by_kind;
    by_kind.kind = ViolationKind::kSqlInjectionSuspected;
    EXPECT_EQ(sink.query(by_kind).size(), 3u);

    AuditEventFilter by_kind_and_client = by_kind;
    by_kind_and_client.client_id = "c2";
    const auto c2 = sink.query(by_kind_and_client);
    ASSERT_EQ(c2.size(), 1u);
    EXPECT_EQ(c2[0].sequence, 6u);

    AuditEventFilter by_severity;
    by_severity.min_severity = Severity::kHigh;
    EXPECT_EQ(sink.query(by_severity).size(), 3u);

    AuditEventFilter by_time;
    by_time.from = kBase + 10s;
    by_time.to   = kBase + 20s;
    EXPECT_EQ(sink.query(by_time).size(), 2u);
}

TEST(MemoryAuditSink, RedeliveredSequence_Ignored) {
    MemoryAuditSink sink;
    const auto events = sample_events();
    ASSERT_EQ(sink.deliver(std::span<const AuditEvent>(events.data(), 2), 1s), DeliveryStatus::kDelivered);
    ASSERT_EQ(sink.deliver(std::span<const AuditEvent>(events.data(), 3), 1s), DeliveryStatus::kDelivered);

    EXPECT_EQ(sink.size(), 3u) << "sequences 1 and 2 were already stored";
    EXPECT_EQ(sink.batches_received(), 2u);
}

TEST(MemoryAuditSink, MaxEvents_OldestDiscarded) {
    MemoryAuditSink sink(2);
    const auto events = sample_events();
    ASSERT_EQ(sink.deliver(std::span<const AuditEvent>(events.data(), 3), 1s), DeliveryStatus::kDelivered);

    const auto kept = sink.events();
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].sequence, 2u);
    EXPECT_EQ(kept[1].sequence, 3u);
}

TEST(MemoryAuditSink, ZeroCapacity_Throws) {
    EXPECT_THROW(MemoryAuditSink(0), std::invalid_argument);
}
