/*
 * 설명: 브로커 환경설정 값과 로딩/검증 규칙을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace broker {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct ProjectRegistration {
  std::string id;
  std::string frontend_origin;
};

struct ProviderConfig {
  std::string client_id;
  std::string client_secret;
  std::string authorize_url{"https://github.com/login/oauth/authorize"};
  std::string token_url{"https://github.com/login/oauth/access_token"};
  std::string scope{"repo,user"};
};

// 시작 시 한 번 만들어지고 이후에는 읽기 전용으로 각 핸들러에 전달된다.
struct AppConfig {
  unsigned short port{3000};
  std::string log_level{"info"};
  bool production{false};
  ProviderConfig provider;
  std::string api_base_url{"http://localhost:3000"};
  std::string callback_path{"/oauth/callback"};
  std::string default_project{"create"};
  std::vector<ProjectRegistration> projects;
  std::vector<std::string> additional_origins;
  std::size_t state_bytes{16};
  std::string state_cookie_name{"oauth_state"};
  std::size_t cookie_max_age_seconds{600};
  std::size_t token_exchange_timeout_ms{10000};
  bool strict_project_callback{false};
  bool project_qualified_redirect{false};
};

constexpr std::size_t kMinStateBytes = 16;
// 이보다 크면 state 쿠키가 브라우저 한도를 넘는다.
constexpr std::size_t kMaxStateBytes = 256;
constexpr std::size_t kMaxTokenExchangeTimeoutMs = 120000;

AppConfig LoadConfigFromEnv();

std::vector<ProjectRegistration> DefaultProjects(bool production);
std::vector<ProjectRegistration> ParseProjectList(const std::string& value);
std::vector<std::string> SplitCommaList(const std::string& value);

bool IsValidProjectId(const std::string& id);

// 비어 있으면 유효한 설정이다.
std::vector<std::string> ValidateConfig(const AppConfig& config);

std::string BuildCallbackUrl(const AppConfig& config, const std::optional<std::string>& project);

}  // namespace broker
