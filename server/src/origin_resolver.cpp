/*
 * 설명: 프로젝트 레지스트리 조회와 CORS 헤더 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/origin_resolver_test.cpp
 */
#include "broker/origin_resolver.hpp"

#include <algorithm>

namespace broker {

namespace {
const char* const kLoopbackOrigins[] = {
    "http://localhost:3000",
    "http://localhost:3001",
    "http://localhost:5173",
    "http://localhost:5174",
};

void AppendUnique(std::vector<std::string>& list, const std::string& origin) {
  if (origin.empty()) {
    return;
  }
  if (std::find(list.begin(), list.end(), origin) == list.end()) {
    list.push_back(origin);
  }
}
}  // namespace

std::vector<std::string> ComputeAllowedOrigins(const AppConfig& config) {
  std::vector<std::string> origins;
  for (const auto& project : config.projects) {
    AppendUnique(origins, project.frontend_origin);
  }
  for (const auto& origin : config.additional_origins) {
    AppendUnique(origins, origin);
  }
  if (!config.production) {
    for (const char* origin : kLoopbackOrigins) {
      AppendUnique(origins, origin);
    }
  }
  return origins;
}

OriginResolver::OriginResolver(const AppConfig& config, std::shared_ptr<Observability> observability)
    : projects_(config.projects),
      default_project_(config.default_project),
      allowed_origins_(ComputeAllowedOrigins(config)),
      observability_(std::move(observability)) {}

bool OriginResolver::IsRegistered(const std::string& project) const {
  return std::any_of(projects_.begin(), projects_.end(),
                     [&](const ProjectRegistration& p) { return p.id == project; });
}

std::string OriginResolver::Resolve(const std::string& project) const {
  auto find = [this](const std::string& id) {
    return std::find_if(projects_.begin(), projects_.end(), [&](const ProjectRegistration& p) { return p.id == id; });
  };
  auto it = find(project);
  if (it != projects_.end()) {
    return it->frontend_origin;
  }
  if (observability_) {
    observability_->Event(LogLevel::kWarn, "project_unknown",
                          {{"project", project}, {"fallback", default_project_}});
  }
  auto fallback = find(default_project_);
  if (fallback != projects_.end()) {
    return fallback->frontend_origin;
  }
  // 기본 프로젝트까지 없으면 설정 검증에서 이미 걸러진다.
  return allowed_origins_.empty() ? std::string{} : allowed_origins_.front();
}

std::string OriginResolver::CorsOrigin(const std::string& request_origin) const {
  if (!request_origin.empty() &&
      std::find(allowed_origins_.begin(), allowed_origins_.end(), request_origin) != allowed_origins_.end()) {
    return request_origin;
  }
  return allowed_origins_.empty() ? std::string{} : allowed_origins_.front();
}

HeaderList OriginResolver::CorsHeaders(const std::string& request_origin) const {
  HeaderList headers;
  auto origin = CorsOrigin(request_origin);
  if (!origin.empty()) {
    headers.emplace_back("Access-Control-Allow-Origin", origin);
    headers.emplace_back("Vary", "Origin");
  }
  headers.emplace_back("Access-Control-Allow-Headers", "Content-Type, Authorization");
  headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  headers.emplace_back("Access-Control-Allow-Credentials", "true");
  return headers;
}

}  // namespace broker
