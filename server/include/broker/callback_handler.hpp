/*
 * 설명: 제공자 콜백을 검증하고 코드를 토큰으로 교환해 프론트엔드 창으로 전달하는 핸들러.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/callback_handler_test.cpp, server/tests/e2e/oauth_flow_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "broker/config.hpp"
#include "broker/handler_types.hpp"
#include "broker/observability.hpp"
#include "broker/origin_resolver.hpp"
#include "broker/token_exchanger.hpp"

namespace broker {

// 단계별 단일 패스이며 모든 실패는 종단(fail-closed)이다.
//   설정 검사 -> 제공자 error -> code/state 존재 -> CSRF 쿠키 일치 -> 프로젝트 해석 -> 토큰 교환 -> 전달
class CallbackProcessor {
 public:
  CallbackProcessor(const AppConfig& config, std::shared_ptr<OriginResolver> resolver,
                    std::shared_ptr<TokenExchanger> exchanger, std::shared_ptr<Observability> observability);

  HandlerResponse Handle(const HandlerRequest& request) const;

 private:
  HandlerResponse Process(const HandlerRequest& request) const;
  HandlerResponse Fail(const HandlerRequest& request, boost::beast::http::status status, const std::string& reason,
                       const std::string& message, const std::string& retry_project = {}) const;
  std::string RetryUrl(const std::string& project) const;

  AppConfig config_;
  std::vector<std::string> config_errors_;
  std::shared_ptr<OriginResolver> resolver_;
  std::shared_ptr<TokenExchanger> exchanger_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace broker
