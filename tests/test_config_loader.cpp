// ---------------------------------------------------------------------------
// test_config_loader.cpp
//
// ConfigLoader / validate_config 단위 테스트.
//
// [테스트 범위]
// - 파일 없음 / YAML 문법 오류 / 최상위가 map 이 아님 → 실패
// - 정상 파일: 모든 섹션 값 반영, 누락 키는 기본값
// - 타입 불일치, 음수/0 제한값, 알 수 없는 severity, 잘못된 duration → 실패 (all-or-nothing)
// - validate_config 불변식 (require_security_headers ⇒ add_security_headers 등)
// - parse_duration / parse_severity
// - 저장소의 config/security.yaml 실제 로딩
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

// 임시 YAML 파일. 소멸 시 삭제한다.
class TempYaml {
public:
    explicit TempYaml(const std::string& content) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = fs::temp_directory_path() /
                (std::string("reqgate_") + info->test_suite_name() + "_" + info->name() + ".yaml");
        std::ofstream out(path_);
        out << content;
    }
    ~TempYaml() { std::remove(path_.c_str()); }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

}  // namespace

// ---------------------------------------------------------------------------
// 로드 실패
// ---------------------------------------------------------------------------
TEST(ConfigLoader, LoadNonExistentFile_ReturnsError) {
    const auto result = ConfigLoader::load("/nonexistent/path/security.yaml");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("config_loader"), std::string::npos) << result.error();
}

TEST(ConfigLoader, LoadFile_InvalidYaml_ReturnsError) {
    TempYaml yaml("limits: [unclosed\n  max_request_size: 1\n");
    const auto result = ConfigLoader::load(yaml.path());
    EXPECT_FALSE(result.has_value());
}

TEST(ConfigLoader, LoadString_TopLevelNotMap_ReturnsError) {
    EXPECT_FALSE(ConfigLoader::load_from_string("- a\n- b\n").has_value());
    EXPECT_FALSE(ConfigLoader::load_from_string("").has_value());
}

// ---------------------------------------------------------------------------
// 정상 로드
// ---------------------------------------------------------------------------
TEST(ConfigLoader, LoadValidFile_Succeeds) {
    TempYaml yaml(R"(
limits:
  max_request_size: 2048
  max_content_length: 1024
  max_parameter_length: 64
  max_parameter_name_length: 32
  max_user_agent_length: 200

headers:
  add_security_headers: true
  require_security_headers: true
  required_headers: ["Content-Type", "X-Api-Key"]
  use_https_only: false

rate_limit:
  enabled: true
  max_requests: 5
  window: 10s
  idle_eviction: 1m

blocking:
  min_blocking_severity: critical
  rate_limit_blocks: true

audit:
  minimum_log_level: medium
  enable_buffering: false
  flush_threshold: 10
  max_buffer_age: 500ms
  buffer_capacity: 50
  delivery_timeout: 2s

logging:
  level: debug
  audit_log_path: /tmp/reqgate_test/audit.log
)");

    const auto result = ConfigLoader::load(yaml.path());
    ASSERT_TRUE(result.has_value()) << "Expected success but got error: " << result.error();

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.max_request_size, 2048);
    EXPECT_EQ(cfg.max_content_length, 1024u);
    EXPECT_EQ(cfg.max_parameter_length, 64u);
    EXPECT_EQ(cfg.max_parameter_name_length, 32u);
    EXPECT_EQ(cfg.max_user_agent_length, 200u);

    EXPECT_TRUE(cfg.require_security_headers);
    ASSERT_EQ(cfg.required_headers.size(), 2u);
    EXPECT_EQ(cfg.required_headers[1], "X-Api-Key");
    EXPECT_FALSE(cfg.use_https_only);

    EXPECT_EQ(cfg.rate_limit.max_requests, 5u);
    EXPECT_EQ(cfg.rate_limit.window, std::chrono::seconds{10});
    EXPECT_EQ(cfg.rate_limit.idle_eviction, std::chrono::minutes{1});

    EXPECT_EQ(cfg.blocking.min_blocking_severity, Severity::kCritical);
    EXPECT_TRUE(cfg.blocking.rate_limit_blocks);

    EXPECT_EQ(cfg.audit.minimum_log_level, Severity::kMedium);
    EXPECT_FALSE(cfg.audit.enable_buffering);
    EXPECT_EQ(cfg.audit.flush_threshold, 10u);
    EXPECT_EQ(cfg.audit.max_buffer_age, std::chrono::milliseconds{500});
    EXPECT_EQ(cfg.audit.buffer_capacity, 50u);
    EXPECT_EQ(cfg.audit.delivery_timeout, std::chrono::seconds{2});

    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.audit_log_path, "/tmp/reqgate_test/audit.log");
}

TEST(ConfigLoader, MissingKeys_UseDefaults) {
    const auto result = ConfigLoader::load_from_string("limits:\n  max_parameter_length: 50\n");
    ASSERT_TRUE(result.has_value()) << result.error();

    const SecurityConfig defaults{};
    EXPECT_EQ(result->max_parameter_length, 50u);
    EXPECT_EQ(result->max_request_size, defaults.max_request_size);
    EXPECT_EQ(result->enable_rate_limiting, defaults.enable_rate_limiting);
    EXPECT_EQ(result->audit.flush_threshold, defaults.audit.flush_threshold);
    EXPECT_EQ(result->blocking.min_blocking_severity, Severity::kHigh);
}

TEST(ConfigLoader, EmptySection_UsesDefaults) {
    const auto result = ConfigLoader::load_from_string("limits:\naudit:\n");
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->max_content_length, SecurityConfig{}.max_content_length);
}

TEST(ConfigLoader, PlainIntegerDurationIsSeconds) {
    const auto result = ConfigLoader::load_from_string("rate_limit:\n  window: 30\n");
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->rate_limit.window, std::chrono::seconds{30});
}

// ---------------------------------------------------------------------------
// 잘못된 값 → 전체 실패
// ---------------------------------------------------------------------------
TEST(ConfigLoader, WrongType_FailsWholeLoad) {
    const auto result = ConfigLoader::load_from_string(
        "limits:\n  max_request_size: big\nheaders:\n  add_security_headers: true\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("limits"), std::string::npos) << result.error();
}

TEST(ConfigLoader, NonPositiveLimit_Fails) {
    EXPECT_FALSE(ConfigLoader::load_from_string("limits:\n  max_content_length: 0\n").has_value());
    EXPECT_FALSE(ConfigLoader::load_from_string("limits:\n  max_parameter_length: -1\n").has_value());
    EXPECT_FALSE(ConfigLoader::load_from_string("rate_limit:\n  max_requests: 0\n").has_value());
}

TEST(ConfigLoader, UnknownSeverity_Fails) {
    const auto result = ConfigLoader::load_from_string("blocking:\n  min_blocking_severity: severe\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("severe"), std::string::npos) << result.error();
}

TEST(ConfigLoader, InvalidDuration_Fails) {
    EXPECT_FALSE(ConfigLoader::load_from_string("audit:\n  max_buffer_age: 10 parsecs\n").has_value());
    EXPECT_FALSE(ConfigLoader::load_from_string("audit:\n  delivery_timeout: 0s\n").has_value());
    EXPECT_FALSE(ConfigLoader::load_from_string("rate_limit:\n  window: 9223372036854775807h\n").has_value())
        << "overflowing duration must be rejected, not wrapped";
}

TEST(ConfigLoader, SectionNotMap_Fails) {
    EXPECT_FALSE(ConfigLoader::load_from_string("limits: 5\n").has_value());
}

TEST(ConfigLoader, RequireWithoutAdd_Fails) {
    const auto result = ConfigLoader::load_from_string(
        "headers:\n  add_security_headers: false\n  require_security_headers: true\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("require_security_headers"), std::string::npos) << result.error();
}

TEST(ConfigLoader, RepositorySampleConfigLoads) {
    const fs::path sample = fs::path(REQGATE_SOURCE_DIR) / "config" / "security.yaml";
    const auto result = ConfigLoader::load(sample);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->rate_limit.max_requests, 60u);
    EXPECT_EQ(result->audit.max_buffer_age, std::chrono::seconds{30});
}

// ---------------------------------------------------------------------------
// validate_config
// ---------------------------------------------------------------------------
TEST(ValidateConfig, DefaultsAreValid) {
    EXPECT_TRUE(validate_config(SecurityConfig{}).has_value());
}

TEST(ValidateConfig, Invariants) {
    {
        SecurityConfig cfg;
        cfg.max_request_size = 0;
        EXPECT_FALSE(validate_config(cfg).has_value());
    }
    {
        SecurityConfig cfg;
        cfg.rate_limit.idle_eviction = cfg.rate_limit.window - std::chrono::seconds{1};
        EXPECT_FALSE(validate_config(cfg).has_value());
    }
    {
        SecurityConfig cfg;
        cfg.audit.flush_threshold = 10;
        cfg.audit.buffer_capacity = 5;
        EXPECT_FALSE(validate_config(cfg).has_value());
    }
    {
        SecurityConfig cfg;
        cfg.logging.level = "loud";
        EXPECT_FALSE(validate_config(cfg).has_value());
    }
}

// ---------------------------------------------------------------------------
// parse helpers
// ---------------------------------------------------------------------------
TEST(ParseDuration, Units) {
    EXPECT_EQ(parse_duration("250ms"), std::chrono::milliseconds{250});
    EXPECT_EQ(parse_duration("3s"), std::chrono::seconds{3});
    EXPECT_EQ(parse_duration("2m"), std::chrono::minutes{2});
    EXPECT_EQ(parse_duration("1h"), std::chrono::hours{1});
    EXPECT_EQ(parse_duration("7"), std::chrono::seconds{7});
    EXPECT_FALSE(parse_duration("").has_value());
    EXPECT_FALSE(parse_duration("s").has_value());
    EXPECT_FALSE(parse_duration("-1s").has_value());
    EXPECT_FALSE(parse_duration("5d").has_value());
}

TEST(ParseDuration, OutOfRange_Rejected) {
    // 2562047h 는 나노초 steady_clock 범위 안, 2562048h 는 밖
    EXPECT_EQ(parse_duration("2562047h"), std::chrono::hours{2562047});
    EXPECT_FALSE(parse_duration("2562048h").has_value());
    EXPECT_FALSE(parse_duration("9223372036854775807h").has_value());
    EXPECT_FALSE(parse_duration("9223372036854775807m").has_value());
    EXPECT_FALSE(parse_duration("9223372036854775807s").has_value());
    EXPECT_FALSE(parse_duration("9223372036854775807ms").has_value());
    EXPECT_FALSE(parse_duration("99999999999999999999s").has_value()) << "from_chars overflow";
}

TEST(ParseSeverity, CaseInsensitive) {
    EXPECT_EQ(parse_severity("LOW"), Severity::kLow);
    EXPECT_EQ(parse_severity("Medium"), Severity::kMedium);
    EXPECT_EQ(parse_severity("high"), Severity::kHigh);
    EXPECT_EQ(parse_severity("critical"), Severity::kCritical);
    EXPECT_FALSE(parse_severity("urgent").has_value());
}
