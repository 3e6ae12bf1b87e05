#pragma once

// ---------------------------------------------------------------------------
// security_middleware.hpp
//
// 요청 검증 파이프라인의 진입점.
//
// [파이프라인]
//   1. RateLimiter (enable_rate_limiting 인 경우)  → RateLimitExceeded
//   2. ValidationService                            → 크기/파라미터/시그니처/헤더 위반
//   3. 보안 응답 헤더 구성 (add_security_headers 인 경우)
//   4. AuditEvent 생성 후 AuditService::record()
//   5. SecurityValidationResult 반환
//
// [계약]
// - 정책 위반은 예외가 아니라 결과의 violations 로만 보고한다.
// - 감사 기록은 관찰 전용이다. is_valid 와 violations 를 바꾸지 않는다.
// - 호출 중 대기(suspension)가 없다. 감사 버퍼링이 켜져 있으면 record() 는 enqueue 만 한다.
// - 설정 오류는 생성 시점에 std::invalid_argument 로 드러난다.
//   설정 교체는 새 인스턴스를 만드는 방식으로 한다.
//
// [스레드 안전성]
// validate_request() 는 여러 스레드에서 동시에 호출해도 안전하다.
// 공유 가변 상태는 RateLimiter 의 클라이언트별 창과 AuditService 의 큐뿐이다.
// ---------------------------------------------------------------------------

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "audit/audit_service.hpp"
#include "audit/audit_sink.hpp"
#include "common/types.hpp"
#include "config/security_config.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "stats/stats_collector.hpp"
#include "validation/sanitizer.hpp"
#include "validation/validation_service.hpp"

class SecurityMiddleware {
public:
    // 이미 구성된 AuditService 를 공유한다 (여러 미들웨어가 같은 감사 큐를 쓰는 경우).
    SecurityMiddleware(const SecurityConfig& config, std::shared_ptr<AuditService> audit);

    // config.audit 설정으로 sink 앞에 AuditService 를 만든다.
    SecurityMiddleware(const SecurityConfig& config, std::shared_ptr<AuditSink> sink);

    ~SecurityMiddleware() = default;

    SecurityMiddleware(const SecurityMiddleware&)            = delete;
    SecurityMiddleware& operator=(const SecurityMiddleware&) = delete;

    // validate_request
    //   요청 1건을 검증하고 결과를 반환한다. 정책 위반으로 예외를 던지지 않는다.
    [[nodiscard]] SecurityValidationResult validate_request(const SecurityRequest& request);

    // generate_security_headers
    //   add_security_headers 가 꺼져 있으면 빈 맵.
    //   Strict-Transport-Security 는 use_https_only 일 때만 포함한다.
    [[nodiscard]] std::unordered_map<std::string, std::string> generate_security_headers() const;

    [[nodiscard]] std::string sanitize_input(std::string_view           input,
                                             const SanitizationOptions& options = {}) const;

    [[nodiscard]] StatsSnapshot         stats() const noexcept { return stats_.snapshot(); }
    [[nodiscard]] const SecurityConfig& config() const noexcept { return config_; }
    [[nodiscard]] AuditService&         audit() noexcept { return *audit_; }

private:
    const SecurityConfig          config_;
    ValidationService             validation_;
    std::unique_ptr<RateLimiter>  rate_limiter_;   // enable_rate_limiting == false 이면 null
    std::shared_ptr<AuditService> audit_;
    StatsCollector                stats_;
};
