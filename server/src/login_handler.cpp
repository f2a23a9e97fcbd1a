/*
 * 설명: 로그인 시작 요청을 검증하고 state 쿠키와 함께 인가 URL로 리다이렉트한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/login_handler_test.cpp, server/tests/e2e/oauth_flow_test.cpp
 */
#include "broker/login_handler.hpp"

#include "broker/api_response.hpp"
#include "broker/cookie.hpp"
#include "broker/state_token.hpp"

namespace broker {

namespace http = boost::beast::http;

LoginInitiator::LoginInitiator(const AppConfig& config, std::shared_ptr<OriginResolver> resolver,
                               std::shared_ptr<Observability> observability)
    : config_(config),
      config_errors_(ValidateConfig(config)),
      resolver_(std::move(resolver)),
      observability_(std::move(observability)) {}

HandlerResponse LoginInitiator::Handle(const HandlerRequest& request) const {
  if (!config_errors_.empty()) {
    observability_->Event(LogLevel::kError, "config_invalid", {{"handler", "login"}, {"errors", config_errors_}},
                          request.trace_id);
    return MakeJsonResponse(http::status::internal_server_error,
                            MakeErrorEnvelope("config_error", "Server configuration error", config_errors_));
  }

  auto cors = resolver_->CorsHeaders(request.origin);
  if (request.method == http::verb::options) {
    auto response = MakeJsonResponse(http::status::ok, MakeSuccessEnvelope({{"message", "OK"}}));
    response.AddHeaders(cors);
    return response;
  }
  if (request.method != http::verb::get) {
    auto response = MakeJsonResponse(http::status::method_not_allowed,
                                     MakeErrorEnvelope("method_not_allowed", "Method not allowed"));
    response.AddHeaders(cors);
    response.SetHeader("Allow", "GET, OPTIONS");
    return response;
  }

  try {
    return Redirect(request, cors);
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kError, "login_failed", {{"reason", ex.what()}}, request.trace_id);
    auto response = MakeJsonResponse(http::status::internal_server_error,
                                     MakeErrorEnvelope("internal_error", "Internal server error"));
    response.AddHeaders(cors);
    return response;
  }
}

std::string LoginInitiator::BuildAuthorizeUrl(const std::string& state, const std::string& project) const {
  const auto& provider = config_.provider;
  std::string url = provider.authorize_url;
  url += provider.authorize_url.find('?') == std::string::npos ? '?' : '&';
  url += "client_id=" + PercentEncode(provider.client_id);
  url += "&redirect_uri=" + PercentEncode(BuildCallbackUrl(config_, project));
  url += "&scope=" + PercentEncode(provider.scope);
  url += "&state=" + PercentEncode(state);
  return url;
}

HandlerResponse LoginInitiator::Redirect(const HandlerRequest& request, const HeaderList& cors) const {
  auto project = request.Query("project").value_or("");
  if (project.empty()) {
    project = config_.default_project;
  }
  // 미등록 프로젝트도 여기서는 막지 않는다. 콜백에서 origin 해석 시 다시 판단한다.
  if (!resolver_->IsRegistered(project)) {
    observability_->Event(LogLevel::kWarn, "project_unknown", {{"handler", "login"}, {"project", project}},
                          request.trace_id);
  }

  auto random = GenerateRandomHex(config_.state_bytes);
  auto state = ComposeStateToken(random, project);
  auto location = BuildAuthorizeUrl(state, project);

  observability_->Event(LogLevel::kInfo, "login_redirect",
                        {{"project", project},
                         {"stateLength", random.size()},
                         {"callbackUrl", BuildCallbackUrl(config_, project)}},
                        request.trace_id);
  observability_->IncrementLoginRedirect();

  HandlerResponse response;
  response.status = http::status::found;
  response.AddHeaders(cors);
  response.SetHeader("Location", location);
  response.SetHeader("Cache-Control", "no-store");
  response.cookies.push_back(SerializeCookie(config_.state_cookie_name, state, StateCookieOptions(config_)));
  return response;
}

}  // namespace broker
