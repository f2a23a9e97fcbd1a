/*
 * 설명: 인가 코드를 액세스 토큰으로 교환하는 서버 간 호출을 추상화한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/token_exchanger_test.cpp, server/tests/e2e/oauth_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace broker {

class TokenExchangeError : public std::runtime_error {
 public:
  explicit TokenExchangeError(const std::string& message, unsigned status = 0)
      : std::runtime_error(message), http_status(status) {}
  unsigned http_status;
};

struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string target;

  std::string HostHeader() const;
};

// http/https만 허용한다. 그 외 스킴이나 호스트가 없으면 std::invalid_argument.
ParsedUrl ParseUrl(const std::string& url);

struct TokenExchangeRequest {
  std::string client_id;
  std::string client_secret;
  std::string code;
  std::string redirect_uri;
};

struct TokenExchangeResult {
  std::optional<std::string> access_token;
  std::optional<std::string> error;
  std::optional<std::string> error_description;
  std::string token_type;
  std::string scope;
  unsigned http_status{0};
};

TokenExchangeResult ParseTokenResponse(unsigned status, const std::string& body);

class TokenExchanger {
 public:
  virtual ~TokenExchanger() = default;
  // 전송 실패, 시간 초과, JSON이 아닌 응답은 TokenExchangeError로 알린다.
  virtual TokenExchangeResult Exchange(const TokenExchangeRequest& request) = 0;
};

// 블로킹 이름 해석. 실패는 예외로 알린다.
using EndpointResolver =
    std::function<std::vector<boost::asio::ip::tcp::endpoint>(const std::string& host, const std::string& port)>;

std::vector<boost::asio::ip::tcp::endpoint> SystemResolve(const std::string& host, const std::string& port);

class HttpTokenExchanger : public TokenExchanger {
 public:
  HttpTokenExchanger(const std::string& token_url, std::chrono::milliseconds timeout,
                     EndpointResolver resolver = SystemResolve);

  TokenExchangeResult Exchange(const TokenExchangeRequest& request) override;

 private:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  Response SendPlain(Request& req);
  Response SendTls(Request& req);

  ParsedUrl endpoint_;
  std::chrono::milliseconds timeout_;
  EndpointResolver resolver_;
  boost::asio::ssl::context ssl_ctx_;
};

}  // namespace broker
