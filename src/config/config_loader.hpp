#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 SecurityConfig 로 로드하고, 설정 불변식을 검사한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환.
//   부분적으로 파싱된 설정을 반환하지 않는다 (all-or-nothing).
// - 설정 오류는 요청 처리 시점이 아니라 생성 시점에 드러나야 한다.
//   SecurityMiddleware 생성자도 validate_config() 를 다시 호출한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [순환 의존성]
// config_loader.hpp → security_config.hpp (단방향만)
// ---------------------------------------------------------------------------

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "security_config.hpp"

// validate_config
//   SecurityConfig 불변식 검사. 위반 시 첫 번째 오류 메시지를 반환한다.
[[nodiscard]] std::expected<void, std::string> validate_config(const SecurityConfig& config);

// parse_severity
//   "low" | "medium" | "high" | "critical" (대소문자 무관) → Severity
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text);

// parse_duration
//   "500ms", "30s", "5m", "1h" 또는 단위 없는 정수(초) → milliseconds
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(std::string_view text);

// ---------------------------------------------------------------------------
// ConfigLoader
//   정적 로드만 제공한다. 파일 감시/Hot Reload 는 하지 않는다
//   (설정 교체는 호출자가 새 미들웨어를 만드는 방식).
// ---------------------------------------------------------------------------
class ConfigLoader {
public:
    ConfigLoader()  = delete;

    // load
    //   지정된 경로의 YAML 파일을 읽어 SecurityConfig 로 파싱한다.
    //
    //   성공: SecurityConfig (validate_config 통과)
    //   실패: std::unexpected(error_message)
    //         파일 없음, YAML 문법 오류, 타입 불일치, 불변식 위반 모두 실패.
    //
    //   누락된 키는 SecurityConfig 기본값을 유지한다.
    [[nodiscard]] static std::expected<SecurityConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   테스트/임베딩용. YAML 문자열을 직접 파싱한다.
    [[nodiscard]] static std::expected<SecurityConfig, std::string>
    load_from_string(std::string_view yaml_text);
};
