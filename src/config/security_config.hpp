#pragma once

// ---------------------------------------------------------------------------
// security_config.hpp
//
// 미들웨어 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/security.yaml 에서 로드되거나 코드에서 직접 구성한다.
//
// [설계 원칙]
// - 모든 멤버는 기본값을 명시한다. 기본값은 "관대한 운영 기본값"이다.
// - 미들웨어는 생성 시 받은 설정을 복사해 보관하고 이후 변경하지 않는다.
//   설정 변경은 새 SecurityMiddleware 인스턴스를 만드는 방식으로 한다.
// - 유효성 검사는 config_loader.hpp 의 validate_config() 가 담당한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RateLimitConfig
//   클라이언트별 슬라이딩 윈도우 설정.
//   window 안에서 max_requests 개까지 허용한다.
//   idle_eviction 동안 요청이 없던 클라이언트 항목은 지연 삭제된다.
//   idle_eviction 은 window 이상이어야 한다 (윈도우가 살아있는 항목 삭제 방지).
// ---------------------------------------------------------------------------
struct RateLimitConfig {
    std::size_t               max_requests{60};
    std::chrono::milliseconds window{std::chrono::seconds{60}};
    std::chrono::milliseconds idle_eviction{std::chrono::minutes{10}};
};

// ---------------------------------------------------------------------------
// BlockingPolicy
//   위반을 차단(is_valid=false)으로 볼지 권고로 볼지 결정한다.
//   min_blocking_severity 이상인 위반은 차단.
//   rate_limit_blocks = true 이면 RateLimitExceeded 는 심각도와 무관하게 차단.
// ---------------------------------------------------------------------------
struct BlockingPolicy {
    Severity min_blocking_severity{Severity::kHigh};
    bool     rate_limit_blocks{false};
};

// ---------------------------------------------------------------------------
// AuditConfig
//   감사 서비스 버퍼링/전달 설정.
//
//   minimum_log_level : 이 심각도 미만의 이벤트는 버린다 (필터링, 오류 아님)
//   enable_buffering  : false 이면 record() 호출마다 동기 전달
//   flush_threshold   : 버퍼가 이 개수에 도달하면 flush
//   max_buffer_age    : 가장 오래된 이벤트가 이 시간을 넘기면 flush
//   buffer_capacity   : 하드 상한. 초과 시 가장 오래된 이벤트부터 버리고 카운트
//   delivery_timeout  : sink 전달 1회당 제한 시간. 초과는 전달 실패로 처리
// ---------------------------------------------------------------------------
struct AuditConfig {
    Severity                  minimum_log_level{Severity::kLow};
    bool                      enable_buffering{true};
    std::size_t               flush_threshold{100};
    std::chrono::milliseconds max_buffer_age{std::chrono::seconds{30}};
    std::size_t               buffer_capacity{10000};
    std::chrono::milliseconds delivery_timeout{std::chrono::seconds{5}};
};

// ---------------------------------------------------------------------------
// LoggingConfig
//   진단 로그 및 LogAuditSink 출력 설정.
//   level: "debug" | "info" | "warn" | "error"
// ---------------------------------------------------------------------------
struct LoggingConfig {
    std::string level{"info"};
    std::string audit_log_path{"/tmp/reqgate/audit.log"};
};

// ---------------------------------------------------------------------------
// SecurityConfig
//   미들웨어 전체 설정의 루트 구조체.
//
//   [불변식]
//   - max_request_size / max_content_length / max_parameter_length > 0
//   - require_security_headers == true 이면 add_security_headers == true
// ---------------------------------------------------------------------------
struct SecurityConfig {
    // 크기 제한
    std::int64_t max_request_size{10 * 1024 * 1024};   // 10MB (선언된 content_length 기준)
    std::size_t  max_content_length{1024 * 1024};      // 1MB  (실제 content 길이 기준)
    std::size_t  max_parameter_length{1000};
    std::size_t  max_parameter_name_length{100};
    std::size_t  max_user_agent_length{500};

    // 헤더
    bool                     add_security_headers{true};
    bool                     require_security_headers{false};
    std::vector<std::string> required_headers{"Content-Type"};
    bool                     use_https_only{true};

    // rate limit
    bool            enable_rate_limiting{true};
    RateLimitConfig rate_limit{};

    BlockingPolicy blocking{};
    AuditConfig    audit{};
    LoggingConfig  logging{};
};
