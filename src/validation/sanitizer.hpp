#pragma once

// ---------------------------------------------------------------------------
// sanitizer.hpp
//
// 입력 정제 유틸리티.
//
// [주의]
// 이 함수들은 "표시/저장용 정제" 이며 탐지(DetectionRuleSet)를 대체하지 않는다.
// 정제 결과가 안전한 HTML 임을 보장하지 않는다 (완전한 HTML sanitizer 아님).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// SanitizationOptions
//   max_length          : 정제 전에 먼저 잘라낼 최대 길이
//   remove_html         : <...> 태그 제거
//   escape_special_chars: & < > " ' 를 HTML 엔티티로 변환
// ---------------------------------------------------------------------------
struct SanitizationOptions {
    std::size_t max_length{1000};
    bool        remove_html{true};
    bool        escape_special_chars{true};
};

// sanitize_input
//   options 에 따라 길이 제한 → 태그 제거 → 특수문자 이스케이프 순으로 적용.
//   두 옵션이 모두 꺼져 있으면 sanitize_text() 로 대체한다.
[[nodiscard]] std::string sanitize_input(std::string_view input,
                                         const SanitizationOptions& options = {});

// sanitize_text
//   앞뒤 공백 제거, max_length 로 자른 뒤 위험 문자/제어 문자를 삭제한다.
[[nodiscard]] std::string sanitize_text(std::string_view input, std::size_t max_length = 1000);

// contains_dangerous_characters
//   < > " ' & NUL CR LF 중 하나라도 포함하면 true.
[[nodiscard]] bool contains_dangerous_characters(std::string_view input) noexcept;

[[nodiscard]] std::string remove_html_tags(std::string_view input);
[[nodiscard]] std::string escape_special_characters(std::string_view input);
