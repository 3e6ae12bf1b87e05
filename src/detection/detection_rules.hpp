#pragma once

// ---------------------------------------------------------------------------
// detection_rules.hpp
//
// 고정 시그니처 기반 공격 패턴 탐지 규칙 집합.
// 외부 의존성 없음. 상태 없음. 모든 메서드는 순수 함수이다.
//
// [탐지 대상: SQL Injection]
// - ; DROP / DELETE / UPDATE / INSERT / ALTER / CREATE / TRUNCATE / EXEC
//                              (stacked statement)
// - ' OR '1'='1               (tautology 기반 인증 우회)
// - -- , /*                    (인라인 주석으로 나머지 구문 무력화)
// - UNION [ALL] SELECT         (UNION 기반 데이터 유출)
// - exec( , execute( , xp_cmdshell (프로시저 실행)
//
// [탐지 대상: XSS]
// - <script , <iframe
// - javascript: , vbscript:   (스크립트 URI)
// - onerror= , onload= 등     (인라인 이벤트 핸들러 속성)
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 인코딩 우회: URL 인코딩(%3Cscript), HTML 엔티티(&#60;script),
//    hex 리터럴은 디코딩하지 않으므로 탐지 불가. 이 모듈은 휴리스틱 필터이며
//    sanitizer 가 아니다.
// 2. 주석 분할: UN/**/ION SEL/**/ECT 는 UNION 규칙으로는 탐지 불가.
//    단, "/*" 자체가 주석 규칙에 걸리므로 결과적으로는 탐지된다.
// 3. 공백 변형: 탭/줄바꿈은 공백으로 취급한다.
//
// [오탐/미탐 트레이드오프]
// - "--" 와 "/*" 는 일반 문장(예: "pages 10--12")에서도 매칭된다.
//   규칙을 좁히면 교과서적 페이로드의 미탐이 늘어나므로 오탐을 감수한다.
// - 이벤트 핸들러는 알려진 이름 목록만 검사한다. 목록 밖의 핸들러는 미탐.
//
// [성능]
// 각 규칙은 입력을 한 번씩 훑는다. 규칙 수가 고정이므로 입력 길이에 선형.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string_view>

// ---------------------------------------------------------------------------
// DetectionRule
//   규칙 식별자 (닫힌 집합). 감사 로그에 rule_name() 으로 기록된다.
// ---------------------------------------------------------------------------
enum class DetectionRule : std::uint8_t {
    kSqlStackedStatement = 0,
    kSqlTautology        = 1,
    kSqlCommentMarker    = 2,
    kSqlUnionSelect      = 3,
    kSqlProcedureExec    = 4,
    kXssScriptTag        = 5,
    kXssIframeTag        = 6,
    kXssJavascriptUri    = 7,
    kXssVbscriptUri      = 8,
    kXssEventHandler     = 9,
};

// ---------------------------------------------------------------------------
// DetectionRuleSet
//   SQL Injection / XSS 시그니처 검사기.
//
//   [스레드 안전성]
//   멤버 상태가 없으므로 한 인스턴스를 여러 스레드에서 공유해도 안전하다.
// ---------------------------------------------------------------------------
class DetectionRuleSet {
public:
    DetectionRuleSet()  = default;
    ~DetectionRuleSet() = default;

    DetectionRuleSet(const DetectionRuleSet&)            = default;
    DetectionRuleSet& operator=(const DetectionRuleSet&) = default;

    // scan_for_sql_injection
    //   text 가 SQL Injection 시그니처 중 하나라도 포함하면 true.
    //   매칭 없음은 정상 결과(false)이며 예외를 던지지 않는다.
    [[nodiscard]] bool scan_for_sql_injection(std::string_view text) const noexcept;

    // scan_for_xss
    //   text 가 스크립트/마크업 주입 시그니처를 포함하면 true.
    //   [미탐 주의] 인코딩된 변형은 디코딩하지 않는다.
    [[nodiscard]] bool scan_for_xss(std::string_view text) const noexcept;

    // first_sql_match / first_xss_match
    //   처음 매칭된 규칙을 반환한다 (감사 로그의 detail 용).
    [[nodiscard]] std::optional<DetectionRule> first_sql_match(std::string_view text) const noexcept;
    [[nodiscard]] std::optional<DetectionRule> first_xss_match(std::string_view text) const noexcept;

    // contains_path_traversal
    //   "../", "..\", 선두 "~" 를 경로 탐색 시도로 본다.
    [[nodiscard]] bool contains_path_traversal(std::string_view text) const noexcept;

    [[nodiscard]] static std::string_view rule_name(DetectionRule rule) noexcept;
};
