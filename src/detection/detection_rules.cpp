// ---------------------------------------------------------------------------
// detection_rules.cpp
//
// 고정 시그니처 탐지 규칙 구현.
//
// [구현 방식]
// std::regex 를 쓰지 않는다. ECMAScript regex 는 백트래킹으로 인해
// 입력 길이에 선형 시간을 보장하지 못하므로, 각 규칙을 대소문자 무관
// 부분 문자열 검사 + 짧은 lookahead 로 직접 구현한다.
//
// [오탐/미탐 트레이드오프]
// - tautology 규칙은 따옴표 뒤 OR 다음에 따옴표/숫자가 오는 형태만 탐지한다.
//   "' OR true" 같은 형태는 미탐 (알려진 한계).
// - stacked statement 규칙은 세미콜론 뒤 공백만 건너뛴다.
//   ";/**/DROP" 는 주석 규칙으로 대신 탐지된다.
// ---------------------------------------------------------------------------

#include "detection/detection_rules.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 대소문자 무관 문자 비교
// ---------------------------------------------------------------------------
bool ichar_equals(char a, char b) noexcept {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: text[pos..] 가 word 로 시작하는지 (대소문자 무관)
// ---------------------------------------------------------------------------
bool istarts_with_at(std::string_view text, std::size_t pos, std::string_view word) noexcept {
    if (pos > text.size() || text.size() - pos < word.size()) {
        return false;
    }
    for (std::size_t i = 0; i < word.size(); ++i) {
        if (!ichar_equals(text[pos + i], word[i])) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 대소문자 무관 부분 문자열 탐색. 없으면 npos.
// ---------------------------------------------------------------------------
std::size_t ifind(std::string_view text, std::string_view needle, std::size_t from = 0) noexcept {
    if (from > text.size()) {
        return std::string_view::npos;
    }
    const auto it = std::search(text.begin() + static_cast<std::ptrdiff_t>(from), text.end(),
                                needle.begin(), needle.end(), ichar_equals);
    if (it == text.end()) {
        return std::string_view::npos;
    }
    return static_cast<std::size_t>(it - text.begin());
}

bool icontains(std::string_view text, std::string_view needle) noexcept {
    return ifind(text, needle) != std::string_view::npos;
}

std::size_t skip_spaces(std::string_view text, std::size_t pos) noexcept {
    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }
    return pos;
}

// ---------------------------------------------------------------------------
// SQL 규칙
// ---------------------------------------------------------------------------

// stacked statement 로 간주하는 세미콜론 뒤 키워드
constexpr std::array<std::string_view, 8> kStackedKeywords{
    "DROP", "DELETE", "UPDATE", "INSERT", "ALTER", "CREATE", "TRUNCATE", "EXEC",
};

bool match_stacked_statement(std::string_view text) noexcept {
    for (std::size_t pos = text.find(';'); pos != std::string_view::npos;
         pos = text.find(';', pos + 1)) {
        const std::size_t kw_pos = skip_spaces(text, pos + 1);
        for (const auto kw : kStackedKeywords) {
            if (istarts_with_at(text, kw_pos, kw)) {
                return true;
            }
        }
    }
    return false;
}

// '\s*OR\s*['"\d]
bool match_tautology(std::string_view text) noexcept {
    for (std::size_t pos = text.find('\''); pos != std::string_view::npos;
         pos = text.find('\'', pos + 1)) {
        std::size_t cur = skip_spaces(text, pos + 1);
        if (!istarts_with_at(text, cur, "OR")) {
            continue;
        }
        cur = skip_spaces(text, cur + 2);
        if (cur >= text.size()) {
            continue;
        }
        const char next = text[cur];
        if (next == '\'' || next == '"' || std::isdigit(static_cast<unsigned char>(next)) != 0) {
            return true;
        }
    }
    return false;
}

bool match_comment_marker(std::string_view text) noexcept {
    return text.find("--") != std::string_view::npos ||
           text.find("/*") != std::string_view::npos;
}

// UNION\s+(ALL\s+)?SELECT
bool match_union_select(std::string_view text) noexcept {
    for (std::size_t pos = ifind(text, "UNION"); pos != std::string_view::npos;
         pos = ifind(text, "UNION", pos + 1)) {
        // "reunion" 같은 단어 내부 매칭 제외
        if (pos > 0 && is_word_char(text[pos - 1])) {
            continue;
        }
        std::size_t cur = pos + 5;
        if (cur >= text.size() || !is_space(text[cur])) {
            continue;
        }
        cur = skip_spaces(text, cur);
        if (istarts_with_at(text, cur, "ALL")) {
            const std::size_t after_all = cur + 3;
            if (after_all < text.size() && is_space(text[after_all])) {
                cur = skip_spaces(text, after_all);
            }
        }
        if (istarts_with_at(text, cur, "SELECT")) {
            return true;
        }
    }
    return false;
}

bool match_procedure_exec(std::string_view text) noexcept {
    return icontains(text, "exec(") ||
           icontains(text, "execute(") ||
           icontains(text, "xp_cmdshell");
}

// ---------------------------------------------------------------------------
// XSS 규칙
// ---------------------------------------------------------------------------

// 인라인 이벤트 핸들러 이름 목록 (알려진 것만)
constexpr std::array<std::string_view, 20> kEventHandlers{
    "onerror",     "onload",      "onclick",    "onmouseover", "onmouseout",
    "onmouseenter", "onfocus",    "onblur",     "onchange",    "onsubmit",
    "oninput",     "onkeydown",   "onkeyup",    "onkeypress",  "ondblclick",
    "onunload",    "onresize",    "onscroll",   "onanimationstart", "ontoggle",
};

bool match_event_handler(std::string_view text) noexcept {
    for (const auto handler : kEventHandlers) {
        for (std::size_t pos = ifind(text, handler); pos != std::string_view::npos;
             pos = ifind(text, handler, pos + 1)) {
            // 단어 경계: "information=" 같은 일반 단어 안의 부분 매칭 제외
            if (pos > 0 && is_word_char(text[pos - 1])) {
                continue;
            }
            const std::size_t cur = skip_spaces(text, pos + handler.size());
            if (cur < text.size() && text[cur] == '=') {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

// ---------------------------------------------------------------------------
// DetectionRuleSet 구현
// ---------------------------------------------------------------------------
std::optional<DetectionRule> DetectionRuleSet::first_sql_match(std::string_view text) const noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    if (match_stacked_statement(text)) {
        return DetectionRule::kSqlStackedStatement;
    }
    if (match_tautology(text)) {
        return DetectionRule::kSqlTautology;
    }
    if (match_union_select(text)) {
        return DetectionRule::kSqlUnionSelect;
    }
    if (match_procedure_exec(text)) {
        return DetectionRule::kSqlProcedureExec;
    }
    if (match_comment_marker(text)) {
        return DetectionRule::kSqlCommentMarker;
    }
    return std::nullopt;
}

std::optional<DetectionRule> DetectionRuleSet::first_xss_match(std::string_view text) const noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    if (icontains(text, "<script")) {
        return DetectionRule::kXssScriptTag;
    }
    if (icontains(text, "<iframe")) {
        return DetectionRule::kXssIframeTag;
    }
    if (icontains(text, "javascript:")) {
        return DetectionRule::kXssJavascriptUri;
    }
    if (icontains(text, "vbscript:")) {
        return DetectionRule::kXssVbscriptUri;
    }
    if (match_event_handler(text)) {
        return DetectionRule::kXssEventHandler;
    }
    return std::nullopt;
}

bool DetectionRuleSet::scan_for_sql_injection(std::string_view text) const noexcept {
    return first_sql_match(text).has_value();
}

bool DetectionRuleSet::scan_for_xss(std::string_view text) const noexcept {
    return first_xss_match(text).has_value();
}

bool DetectionRuleSet::contains_path_traversal(std::string_view text) const noexcept {
    if (text.empty()) {
        return false;
    }
    return text.find("../") != std::string_view::npos ||
           text.find("..\\") != std::string_view::npos ||
           text.front() == '~';
}

std::string_view DetectionRuleSet::rule_name(DetectionRule rule) noexcept {
    switch (rule) {
        case DetectionRule::kSqlStackedStatement: return "sql-stacked-statement";
        case DetectionRule::kSqlTautology:        return "sql-tautology";
        case DetectionRule::kSqlCommentMarker:    return "sql-comment-marker";
        case DetectionRule::kSqlUnionSelect:      return "sql-union-select";
        case DetectionRule::kSqlProcedureExec:    return "sql-procedure-exec";
        case DetectionRule::kXssScriptTag:        return "xss-script-tag";
        case DetectionRule::kXssIframeTag:        return "xss-iframe-tag";
        case DetectionRule::kXssJavascriptUri:    return "xss-javascript-uri";
        case DetectionRule::kXssVbscriptUri:      return "xss-vbscript-uri";
        case DetectionRule::kXssEventHandler:     return "xss-event-handler";
    }
    return "unknown";
}
