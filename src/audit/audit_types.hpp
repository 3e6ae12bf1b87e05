#pragma once

// ---------------------------------------------------------------------------
// audit_types.hpp
//
// 감사 서브시스템에서 사용하는 이벤트 타입 정의.
//
// [소유권]
// AuditEvent 는 미들웨어가 검증 호출마다 생성하고 AuditService::record() 로 넘긴다.
// 버퍼에 있는 동안은 AuditService 가, sink 전달 후에는 sink 가 소유한다.
//
// [민감정보 취급 주의]
// violations[].detail 은 필드 이름만 담는다. 요청 본문/파라미터 값은 넣지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// AuditOutcome
//   검증 결과. Blocked 는 SecurityValidationResult::is_valid == false 와 같다.
// ---------------------------------------------------------------------------
enum class AuditOutcome : std::uint8_t {
    kAllowed = 0,
    kBlocked = 1,
};

inline constexpr std::string_view audit_outcome_to_string(AuditOutcome outcome) noexcept {
    switch (outcome) {
        case AuditOutcome::kAllowed: return "allowed";
        case AuditOutcome::kBlocked: return "blocked";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// AuditEvent
//   severity: violations 중 최고 심각도. 위반이 없으면 kLow.
//   sequence: AuditService 가 record() 시점에 부여하는 단조 증가 번호.
//             record() 전에는 0 이다.
// ---------------------------------------------------------------------------
struct AuditEvent {
    std::chrono::system_clock::time_point timestamp{};
    std::string                           client_id{};
    std::string                           endpoint{};
    Severity                              severity{Severity::kLow};
    std::vector<SecurityViolation>        violations{};
    AuditOutcome                          outcome{AuditOutcome::kAllowed};
    std::uint64_t                         sequence{0};
};

// highest_severity
//   위반 목록의 최고 심각도. 빈 목록이면 kLow.
[[nodiscard]] inline Severity highest_severity(std::span<const SecurityViolation> violations) noexcept {
    Severity highest = Severity::kLow;
    for (const auto& v : violations) {
        highest = std::max(highest, v.severity);
    }
    return highest;
}
