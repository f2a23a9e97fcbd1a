/*
 * 설명: HTTP 연결을 처리하고 OAuth 로그인/콜백, 헬스, 메트릭 엔드포인트로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/oauth_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "broker/callback_handler.hpp"
#include "broker/config.hpp"
#include "broker/handler_types.hpp"
#include "broker/login_handler.hpp"
#include "broker/observability.hpp"

namespace broker {

using BeastRequest = boost::beast::http::request<boost::beast::http::string_body>;
using BeastResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Beast 요청을 핸들러 입력으로 바꾼다. 쿼리와 쿠키는 디코딩된 상태로 담긴다.
HandlerRequest ToHandlerRequest(const BeastRequest& req);
void ApplyHandlerResponse(const HandlerResponse& response, BeastResponse& res);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<LoginInitiator> login, std::shared_ptr<CallbackProcessor> callback,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  HandlerResponse Dispatch(const HandlerRequest& request);
  void SendResponse(std::shared_ptr<BeastResponse> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  BeastRequest req_;
  AppConfig config_;
  std::shared_ptr<LoginInitiator> login_;
  std::shared_ptr<CallbackProcessor> callback_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::string path_;
};

}  // namespace broker
