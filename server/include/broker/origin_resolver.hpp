/*
 * 설명: 프로젝트 id를 프론트엔드 origin으로 해석하고 CORS 허용 목록을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/origin_resolver_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "broker/config.hpp"
#include "broker/observability.hpp"

namespace broker {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// 등록 origin, ADDITIONAL_ORIGINS, 비운영 환경의 localhost origin 순서. 중복은 제거한다.
std::vector<std::string> ComputeAllowedOrigins(const AppConfig& config);

class OriginResolver {
 public:
  OriginResolver(const AppConfig& config, std::shared_ptr<Observability> observability);

  bool IsRegistered(const std::string& project) const;
  // 미등록 id는 기본 프로젝트 origin으로 대체하고 경고를 남긴다. 예외를 던지지 않는다.
  std::string Resolve(const std::string& project) const;

  const std::vector<std::string>& AllowedOrigins() const { return allowed_origins_; }
  std::string CorsOrigin(const std::string& request_origin) const;
  HeaderList CorsHeaders(const std::string& request_origin) const;

 private:
  std::vector<ProjectRegistration> projects_;
  std::string default_project_;
  std::vector<std::string> allowed_origins_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace broker
