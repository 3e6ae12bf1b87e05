// ---------------------------------------------------------------------------
// sanitizer.cpp
//
// 입력 정제 유틸리티 구현.
//
// [remove_html_tags 한계]
// "<" 부터 가장 가까운 ">" 까지를 태그로 보고 삭제한다 (비탐욕 매칭).
// 닫히지 않은 "<" 는 그대로 남는다. 속성 값 안의 ">" 는 고려하지 않는다.
// ---------------------------------------------------------------------------

#include "validation/sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace {

constexpr std::string_view kDangerousChars{"<>\"'&\0\r\n", 8};

bool is_dangerous(char c) noexcept {
    return kDangerousChars.find(c) != std::string_view::npos;
}

std::string_view trim(std::string_view sv) noexcept {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())) != 0) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())) != 0) {
        sv.remove_suffix(1);
    }
    return sv;
}

}  // namespace

bool contains_dangerous_characters(std::string_view input) noexcept {
    return std::any_of(input.begin(), input.end(), is_dangerous);
}

std::string remove_html_tags(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    std::size_t pos = 0;
    while (pos < input.size()) {
        const std::size_t open = input.find('<', pos);
        if (open == std::string_view::npos) {
            out.append(input.substr(pos));
            break;
        }
        const std::size_t close = input.find('>', open + 1);
        if (close == std::string_view::npos) {
            // 닫히지 않은 태그: 나머지를 그대로 둔다
            out.append(input.substr(pos));
            break;
        }
        out.append(input.substr(pos, open - pos));
        pos = close + 1;
    }
    return out;
}

std::string escape_special_characters(std::string_view input) {
    std::string out;
    out.reserve(input.size() + 16);
    for (const char c : input) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default:   out += c;        break;
        }
    }
    return out;
}

std::string sanitize_text(std::string_view input, std::size_t max_length) {
    std::string_view trimmed = trim(input);
    if (trimmed.empty()) {
        return {};
    }
    if (trimmed.size() > max_length) {
        trimmed = trimmed.substr(0, max_length);
    }

    std::string out;
    out.reserve(trimmed.size());
    for (const char c : trimmed) {
        if (is_dangerous(c) || std::iscntrl(static_cast<unsigned char>(c)) != 0) {
            continue;
        }
        out += c;
    }
    return out;
}

std::string sanitize_input(std::string_view input, const SanitizationOptions& options) {
    if (input.empty()) {
        return {};
    }

    std::string_view limited = input;
    if (limited.size() > options.max_length) {
        limited = limited.substr(0, options.max_length);
    }

    std::string sanitized{limited};

    if (options.remove_html) {
        sanitized = remove_html_tags(sanitized);
    }

    if (options.escape_special_chars) {
        sanitized = escape_special_characters(sanitized);
    } else if (!options.remove_html) {
        sanitized = sanitize_text(sanitized, options.max_length);
    }

    return sanitized;
}
