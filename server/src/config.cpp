/*
 * 설명: 환경변수에서 브로커 설정을 읽고 필수 항목을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "broker/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>

#include "broker/cookie.hpp"
#include "broker/origin_resolver.hpp"

namespace broker {

namespace {
std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::size_t ParseSize(const std::string& key, const std::string& value) {
  // stoul은 "-1"을 최댓값으로 감싸 버리므로 부호는 미리 거른다.
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError(key + " 값이 숫자가 아닙니다: " + value);
  }
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size()) {
      throw ConfigError(key + " 값이 숫자가 아닙니다: " + value);
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::logic_error&) {
    throw ConfigError(key + " 값이 숫자가 아닙니다: " + value);
  }
}

std::size_t ParseSizeInRange(const std::string& key, const std::string& value, std::size_t min, std::size_t max) {
  auto parsed = ParseSize(key, value);
  if (parsed < min || parsed > max) {
    throw ConfigError(key + " 값은 " + std::to_string(min) + "~" + std::to_string(max) + " 범위여야 합니다: " + value);
  }
  return parsed;
}
}  // namespace

std::vector<ProjectRegistration> DefaultProjects(bool production) {
  return {
      {"create", production ? "https://create.rbios.net" : "http://localhost:5173"},
      {"prompts", production ? "https://prompts.rbios.net" : "http://localhost:5174"},
  };
}

std::vector<std::string> SplitCommaList(const std::string& value) {
  std::vector<std::string> items;
  std::size_t pos = 0;
  while (pos <= value.size()) {
    auto comma = value.find(',', pos);
    auto item = Trim(value.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos));
    if (!item.empty()) {
      items.push_back(item);
    }
    if (comma == std::string::npos) {
      break;
    }
    pos = comma + 1;
  }
  return items;
}

std::vector<ProjectRegistration> ParseProjectList(const std::string& value) {
  std::vector<ProjectRegistration> projects;
  for (const auto& entry : SplitCommaList(value)) {
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
      throw ConfigError("프로젝트 항목 형식은 id=origin 이어야 합니다: " + entry);
    }
    ProjectRegistration project{Trim(entry.substr(0, eq)), Trim(entry.substr(eq + 1))};
    if (!IsValidProjectId(project.id)) {
      throw ConfigError("프로젝트 id에 허용되지 않는 문자가 있습니다: " + project.id);
    }
    if (project.frontend_origin.empty()) {
      throw ConfigError("프로젝트 origin이 비어 있습니다: " + project.id);
    }
    auto duplicate = std::find_if(projects.begin(), projects.end(),
                                  [&](const ProjectRegistration& p) { return p.id == project.id; });
    if (duplicate != projects.end()) {
      throw ConfigError("프로젝트 id가 중복되었습니다: " + project.id);
    }
    projects.push_back(std::move(project));
  }
  return projects;
}

bool IsValidProjectId(const std::string& id) {
  if (id.empty() || id.size() > 64) {
    return false;
  }
  return std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
  });
}

std::vector<std::string> ValidateConfig(const AppConfig& config) {
  std::vector<std::string> errors;
  if (config.provider.client_id.empty()) {
    errors.emplace_back("Missing GitHub Client ID");
  }
  if (config.provider.client_secret.empty()) {
    errors.emplace_back("Missing GitHub Client Secret");
  }
  if (ComputeAllowedOrigins(config).empty()) {
    errors.emplace_back("No allowed origins configured");
  }
  auto registered = std::any_of(config.projects.begin(), config.projects.end(),
                                [&](const ProjectRegistration& p) { return p.id == config.default_project; });
  if (!registered) {
    errors.emplace_back("Default project is not registered");
  }
  return errors;
}

std::string BuildCallbackUrl(const AppConfig& config, const std::optional<std::string>& project) {
  std::string url = config.api_base_url + config.callback_path;
  if (config.project_qualified_redirect && project && !project->empty()) {
    url += "?project=" + PercentEncode(*project);
  }
  return url;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_env_either = [&](const char* key, const char* fallback_key) -> std::string {
    auto value = get_env(key, "");
    return value.empty() ? get_env(fallback_key, "") : value;
  };

  AppConfig cfg;
  auto port = ParseSize("SERVER_PORT", get_env("SERVER_PORT", "3000"));
  if (port > std::numeric_limits<unsigned short>::max()) {
    throw ConfigError("SERVER_PORT 범위를 벗어났습니다");
  }
  cfg.port = static_cast<unsigned short>(port);
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.production = get_env("APP_ENV", "development") == "production";

  cfg.provider.client_id = get_env_either("GITHUB_CLIENT_ID", "GH_CLIENT_ID");
  cfg.provider.client_secret = get_env_either("GITHUB_CLIENT_SECRET", "GH_CLIENT_SECRET");
  cfg.provider.authorize_url = get_env("OAUTH_AUTHORIZE_URL", "https://github.com/login/oauth/authorize");
  cfg.provider.token_url = get_env("OAUTH_TOKEN_URL", "https://github.com/login/oauth/access_token");
  cfg.provider.scope = get_env("OAUTH_SCOPE", "repo,user");

  cfg.api_base_url = get_env("OAUTH_API_URL", cfg.production ? "https://api.rbios.net" : "http://localhost:3000");
  cfg.default_project = get_env("OAUTH_DEFAULT_PROJECT", "create");

  auto projects = get_env("OAUTH_PROJECTS", "");
  cfg.projects = projects.empty() ? DefaultProjects(cfg.production) : ParseProjectList(projects);
  cfg.additional_origins = SplitCommaList(get_env("ADDITIONAL_ORIGINS", ""));

  auto state_bytes = ParseSizeInRange("OAUTH_STATE_BYTES", get_env("OAUTH_STATE_BYTES", "16"), 0, kMaxStateBytes);
  cfg.state_bytes = std::max(kMinStateBytes, state_bytes);
  cfg.token_exchange_timeout_ms = ParseSizeInRange(
      "OAUTH_TOKEN_TIMEOUT_MS", get_env("OAUTH_TOKEN_TIMEOUT_MS", "10000"), 1, kMaxTokenExchangeTimeoutMs);
  cfg.strict_project_callback = get_env("OAUTH_STRICT_PROJECTS", "false") == "true";
  cfg.project_qualified_redirect = get_env("OAUTH_PROJECT_REDIRECT", "false") == "true";
  return cfg;
}

}  // namespace broker
