/*
 * 설명: HTTP 요청을 읽어 OAuth 로그인/콜백과 운영 엔드포인트로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/oauth_flow_test.cpp
 */
#include "broker/http_session.hpp"

#include <boost/beast/version.hpp>

#include "broker/api_response.hpp"
#include "broker/cookie.hpp"

namespace broker {

namespace http = boost::beast::http;

namespace {
constexpr const char* kServiceName = "oauth-broker";
constexpr const char* kServiceVersion = "v1.0.0";
}  // namespace

HandlerRequest ToHandlerRequest(const BeastRequest& req) {
  HandlerRequest request;
  request.method = req.method();
  std::string target_str = std::string(req.target());
  auto qpos = target_str.find('?');
  request.path = qpos == std::string::npos ? target_str : target_str.substr(0, qpos);
  if (qpos != std::string::npos) {
    request.query = ParseQueryString(std::string_view(target_str).substr(qpos + 1));
  }
  // Cookie 헤더가 여러 줄로 온 경우도 모두 합친다.
  auto range = req.base().equal_range(http::field::cookie);
  for (auto it = range.first; it != range.second; ++it) {
    auto value = it->value();
    for (auto& cookie : ParseCookies(std::string_view(value.data(), value.size()))) {
      request.cookies.emplace(cookie.first, std::move(cookie.second));
    }
  }
  auto origin_it = req.find(http::field::origin);
  if (origin_it != req.end()) {
    request.origin = std::string(origin_it->value());
  }
  return request;
}

void ApplyHandlerResponse(const HandlerResponse& response, BeastResponse& res) {
  res.result(response.status);
  for (const auto& header : response.headers) {
    res.set(header.first, header.second);
  }
  // Set-Cookie는 합치면 안 되므로 항목마다 별도 필드로 넣는다.
  for (const auto& cookie : response.cookies) {
    res.insert(http::field::set_cookie, cookie);
  }
  res.body() = response.body;
  res.content_length(res.body().size());
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<LoginInitiator> login, std::shared_ptr<CallbackProcessor> callback,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)),
      config_(config),
      login_(std::move(login)),
      callback_(std::move(callback)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_,
                   [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                     self->OnRead(ec, bytes_transferred);
                   });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();

  auto res = std::make_shared<BeastResponse>();
  res->version(req_.version());
  res->set(http::field::server, kServiceName);

  HandlerResponse response;
  try {
    auto request = ToHandlerRequest(req_);
    request.trace_id = trace_id_;
    path_ = request.path;
    response = Dispatch(request);
  } catch (const std::exception& ex) {
    // 핸들러 밖으로 나온 예외는 여기서 멈춘다. 상세 내용은 로그에만 남긴다.
    observability_->Event(LogLevel::kError, "unhandled_exception", {{"reason", ex.what()}}, trace_id_);
    response = MakeJsonResponse(http::status::internal_server_error,
                                MakeErrorEnvelope("internal_error", "Internal server error"));
  }
  ApplyHandlerResponse(response, *res);
  SendResponse(res);
}

HandlerResponse HttpSession::Dispatch(const HandlerRequest& request) {
  if (request.path == "/oauth/login") {
    return login_->Handle(request);
  }
  if (request.path == "/oauth/callback") {
    return callback_->Handle(request);
  }

  if (request.method == http::verb::get && request.path == "/health") {
    nlohmann::json data{{"status", "healthy"},
                        {"service", kServiceName},
                        {"environment", config_.production ? "production" : "development"}};
    return MakeJsonResponse(http::status::ok, MakeSuccessEnvelope(data));
  }

  if (request.method == http::verb::get && request.path == "/") {
    nlohmann::json data{{"service", kServiceName},
                        {"version", kServiceVersion},
                        {"endpoints",
                         {"GET /oauth/login - Initiate OAuth flow", "GET /oauth/callback - Handle OAuth callback",
                          "GET /health - Health check"}}};
    return MakeJsonResponse(http::status::ok, MakeSuccessEnvelope(data));
  }

  if (request.method == http::verb::get && request.path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"login", {{"redirects", snapshot.login_redirects}}},
                        {"callback", {{"success", snapshot.callback_success}, {"failures", snapshot.callback_failures}}}};
    return MakeJsonResponse(http::status::ok, MakeSuccessEnvelope(data));
  }

  return MakeJsonResponse(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendResponse(std::shared_ptr<BeastResponse> res) {
  auto self = shared_from_this();
  auto status = static_cast<unsigned>(res->result_int());
  if (status >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  // 쿼리(code, state)는 접근 로그에 남기지 않는다.
  observability_->Log(
      LogContext{trace_id_, std::string(http::to_string(req_.method())), path_, status, static_cast<long>(latency)});
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace broker
