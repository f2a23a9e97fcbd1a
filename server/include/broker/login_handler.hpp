/*
 * 설명: CSRF state를 발급하고 제공자 인가 엔드포인트로 리다이렉트하는 로그인 시작 핸들러.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/login_handler_test.cpp, server/tests/e2e/oauth_flow_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "broker/config.hpp"
#include "broker/handler_types.hpp"
#include "broker/observability.hpp"
#include "broker/origin_resolver.hpp"

namespace broker {

class LoginInitiator {
 public:
  LoginInitiator(const AppConfig& config, std::shared_ptr<OriginResolver> resolver,
                 std::shared_ptr<Observability> observability);

  HandlerResponse Handle(const HandlerRequest& request) const;

  std::string BuildAuthorizeUrl(const std::string& state, const std::string& project) const;

 private:
  HandlerResponse Redirect(const HandlerRequest& request, const HeaderList& cors) const;

  AppConfig config_;
  std::vector<std::string> config_errors_;
  std::shared_ptr<OriginResolver> resolver_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace broker
