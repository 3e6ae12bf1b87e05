#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   spdlog 전역 레지스트리에 등록하지 않으므로 여러 인스턴스가 공존할 수 있다.
// - 한 이벤트 = 한 줄 JSON. 키는 snake_case.
// - 요청 본문/파라미터 값은 AuditEvent 에 없으므로 로그에도 남지 않는다.
//
// [출력]
// stdout (선택) + rotating file (100MB x 3). 매 레코드마다 flush 한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include "audit/audit_types.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/common.h>
#include <spdlog/logger.h>

// ---------------------------------------------------------------------------
// StructuredLogger
//   AuditEvent 를 JSON 포맷으로 기록한다.
//   Allowed 이벤트는 info, Blocked 이벤트는 warn 레벨로 기록한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level      : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path       : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   echo_to_stdout : true 이면 stdout 에도 같은 줄을 쓴다.
    //   싱크 생성 실패 시 std::runtime_error.
    StructuredLogger(LogLevel                     min_level,
                     const std::filesystem::path& log_path,
                     bool                         echo_to_stdout = true);

    ~StructuredLogger() = default;

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // log_audit
    //   감사 이벤트 1건을 JSON 한 줄로 기록한다.
    void log_audit(const AuditEvent& event);

    void flush();

    [[nodiscard]] const std::filesystem::path& log_path() const noexcept { return log_path_; }

    // to_audit_json
    //   log_audit() 이 기록하는 JSON 본문. 테스트와 다른 sink 에서 재사용한다.
    [[nodiscard]] static std::string to_audit_json(const AuditEvent& event);

private:
    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
