/*
 * 설명: 콜백 상태 기계를 구현한다. 어느 단계든 실패하면 실패 문서로 종료한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/callback_handler_test.cpp, server/tests/e2e/oauth_flow_test.cpp
 */
#include "broker/callback_handler.hpp"

#include "broker/api_response.hpp"
#include "broker/cookie.hpp"
#include "broker/html_page.hpp"
#include "broker/state_token.hpp"

namespace broker {

namespace http = boost::beast::http;

namespace {
// 로그에는 state의 앞부분만 남긴다.
nlohmann::json Redacted(const std::optional<std::string>& value) {
  if (!value) {
    return nullptr;
  }
  return value->substr(0, 8) + "...";
}

std::string Join(const std::vector<std::string>& items, const std::string& separator) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += separator;
    }
    out += item;
  }
  return out;
}
}  // namespace

CallbackProcessor::CallbackProcessor(const AppConfig& config, std::shared_ptr<OriginResolver> resolver,
                                     std::shared_ptr<TokenExchanger> exchanger,
                                     std::shared_ptr<Observability> observability)
    : config_(config),
      config_errors_(ValidateConfig(config)),
      resolver_(std::move(resolver)),
      exchanger_(std::move(exchanger)),
      observability_(std::move(observability)) {}

HandlerResponse CallbackProcessor::Handle(const HandlerRequest& request) const {
  if (!config_errors_.empty()) {
    observability_->Event(LogLevel::kError, "config_invalid", {{"handler", "callback"}, {"errors", config_errors_}},
                          request.trace_id);
    observability_->IncrementCallbackFailure();
    return MakeHtmlResponse(http::status::internal_server_error,
                            RenderFailurePage("Server configuration error: " + Join(config_errors_, ", ")));
  }
  if (request.method != http::verb::get) {
    auto response = MakeJsonResponse(http::status::method_not_allowed,
                                     MakeErrorEnvelope("method_not_allowed", "Method not allowed"));
    response.AddHeaders(resolver_->CorsHeaders(request.origin));
    response.SetHeader("Allow", "GET");
    return response;
  }

  try {
    return Process(request);
  } catch (const std::exception& ex) {
    // 상세 원인은 운영 로그로만 보내고 응답 본문에는 남기지 않는다.
    observability_->Event(LogLevel::kError, "callback_exception", {{"reason", ex.what()}}, request.trace_id);
    return Fail(request, http::status::internal_server_error, "internal_error", "Internal server error");
  }
}

HandlerResponse CallbackProcessor::Process(const HandlerRequest& request) const {
  auto provider_error = request.Query("error");
  if (provider_error && !provider_error->empty()) {
    std::string message = "GitHub error: " + *provider_error;
    auto description = request.Query("error_description");
    if (description && !description->empty()) {
      message += " (" + *description + ")";
    }
    return Fail(request, http::status::bad_request, "provider_error", message, config_.default_project);
  }

  auto code = request.Query("code").value_or("");
  auto state = request.Query("state").value_or("");
  if (code.empty() || state.empty()) {
    observability_->Event(LogLevel::kWarn, "callback_missing_parameters",
                          {{"hasCode", !code.empty()}, {"hasState", !state.empty()}}, request.trace_id);
    return Fail(request, http::status::bad_request, "missing_parameters", "Missing authorization code or state",
                config_.default_project);
  }

  auto stored_state = request.Cookie(config_.state_cookie_name);
  if (!stored_state || !ConstantTimeEquals(*stored_state, state)) {
    observability_->Event(LogLevel::kWarn, "csrf_mismatch",
                          {{"storedState", Redacted(stored_state)}, {"providedState", Redacted(state)}},
                          request.trace_id);
    return Fail(request, http::status::bad_request, "csrf_mismatch", "Invalid state parameter - possible CSRF attack",
                config_.default_project);
  }

  auto project = ParseStateToken(state, config_.default_project).project;
  bool registered = resolver_->IsRegistered(project);
  if (!registered && config_.strict_project_callback) {
    observability_->Event(LogLevel::kWarn, "project_unknown", {{"handler", "callback"}, {"project", project}},
                          request.trace_id);
    return Fail(request, http::status::bad_request, "project_unknown", "Unknown project", config_.default_project);
  }
  auto frontend_origin = resolver_->Resolve(project);
  auto retry_project = registered ? project : config_.default_project;

  observability_->Event(LogLevel::kInfo, "token_exchange",
                        {{"project", project}, {"frontendOrigin", frontend_origin}, {"codeLength", code.size()}},
                        request.trace_id);

  TokenExchangeRequest exchange_request{config_.provider.client_id, config_.provider.client_secret, code,
                                        BuildCallbackUrl(config_, project)};
  TokenExchangeResult result;
  try {
    result = exchanger_->Exchange(exchange_request);
  } catch (const TokenExchangeError& ex) {
    observability_->Event(LogLevel::kError, "token_exchange_failed",
                          {{"reason", ex.what()}, {"httpStatus", ex.http_status}}, request.trace_id);
    return Fail(request, http::status::bad_gateway, "upstream_unreachable", "Failed to contact the identity provider",
                retry_project);
  }

  if (result.error) {
    observability_->Event(LogLevel::kError, "token_exchange_rejected",
                          {{"error", *result.error}, {"errorDescription", result.error_description.value_or("")}},
                          request.trace_id);
    return Fail(request, http::status::bad_request, "upstream_error",
                "Failed to obtain access token: " + result.error_description.value_or(*result.error), retry_project);
  }
  if (!result.access_token) {
    observability_->Event(LogLevel::kError, "token_missing", {{"httpStatus", result.http_status}}, request.trace_id);
    return Fail(request, http::status::bad_request, "no_access_token", "No access token received from GitHub",
                retry_project);
  }

  // 토큰 값은 로그에 남기지 않는다.
  observability_->Event(LogLevel::kInfo, "callback_success",
                        {{"project", project},
                         {"tokenType", result.token_type},
                         {"scope", result.scope},
                         {"tokenLength", result.access_token->size()}},
                        request.trace_id);
  observability_->IncrementCallbackSuccess();

  auto response = MakeHtmlResponse(http::status::ok, RenderSuccessPage(*result.access_token, frontend_origin));
  response.AddHeaders(resolver_->CorsHeaders(request.origin));
  response.cookies.push_back(SerializeCookie(config_.state_cookie_name, "", ExpiredStateCookieOptions(config_)));
  return response;
}

HandlerResponse CallbackProcessor::Fail(const HandlerRequest& request, http::status status, const std::string& reason,
                                        const std::string& message, const std::string& retry_project) const {
  observability_->Event(LogLevel::kWarn, "callback_rejected",
                        {{"reason", reason}, {"status", static_cast<unsigned>(status)}}, request.trace_id);
  observability_->IncrementCallbackFailure();

  auto response = MakeHtmlResponse(status, RenderFailurePage(message, RetryUrl(retry_project)));
  response.AddHeaders(resolver_->CorsHeaders(request.origin));
  // state는 한 번만 쓰인다. 실패해도 쿠키를 만료시켜 재시도는 새 로그인부터 시작하게 한다.
  response.cookies.push_back(SerializeCookie(config_.state_cookie_name, "", ExpiredStateCookieOptions(config_)));
  return response;
}

std::string CallbackProcessor::RetryUrl(const std::string& project) const {
  if (project.empty() || !IsValidProjectId(project)) {
    return {};
  }
  return config_.api_base_url + "/oauth/login?project=" + project;
}

}  // namespace broker
