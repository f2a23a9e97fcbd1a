/*
 * 설명: 제공자 토큰 엔드포인트로 JSON POST를 보내고 응답을 해석한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/token_exchanger_test.cpp, server/tests/e2e/oauth_flow_test.cpp
 */
#include "broker/token_exchanger.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/ssl.h>

namespace broker {

namespace {
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using Clock = std::chrono::steady_clock;

// 비동기 연산 하나를 마감 시각까지만 돌린다. 마감을 넘기면 남은 작업은 io_context와 함께 버려진다.
void RunUntilDone(boost::asio::io_context& ioc, Clock::time_point deadline, const char* stage) {
  ioc.restart();
  ioc.run_until(deadline);
  if (!ioc.stopped()) {
    throw TokenExchangeError(std::string("토큰 교환 시간 초과: ") + stage);
  }
}

void Check(const beast::error_code& ec, const char* stage) {
  if (ec) {
    throw TokenExchangeError(std::string(stage) + " 실패: " + ec.message());
  }
}

struct ResolveState {
  std::mutex mutex;
  std::condition_variable cv;
  bool done{false};
  std::vector<tcp::endpoint> endpoints;
  std::string error;
};

// getaddrinfo는 취소할 수 없다. 분리된 스레드에서 돌리고 마감 시각까지만 기다린다.
// 늦게 끝난 해석 결과는 공유 상태와 함께 버려진다.
std::vector<tcp::endpoint> Resolve(const EndpointResolver& resolver, const ParsedUrl& endpoint,
                                   Clock::time_point deadline) {
  auto state = std::make_shared<ResolveState>();
  std::thread([state, resolver, host = endpoint.host, port = endpoint.port]() {
    std::vector<tcp::endpoint> endpoints;
    std::string error;
    try {
      endpoints = resolver(host, port);
    } catch (const std::exception& ex) {
      error = ex.what();
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    state->endpoints = std::move(endpoints);
    state->error = std::move(error);
    state->done = true;
    state->cv.notify_all();
  }).detach();

  std::unique_lock<std::mutex> lock(state->mutex);
  if (!state->cv.wait_until(lock, deadline, [&state]() { return state->done; })) {
    throw TokenExchangeError("토큰 교환 시간 초과: resolve");
  }
  if (!state->error.empty()) {
    throw TokenExchangeError("resolve 실패: " + state->error);
  }
  if (state->endpoints.empty()) {
    throw TokenExchangeError("resolve 실패: 주소가 없습니다");
  }
  return state->endpoints;
}

template <class Stream>
http::response<http::string_body> RoundTrip(boost::asio::io_context& ioc, Stream& stream,
                                            http::request<http::string_body>& req, Clock::time_point deadline) {
  beast::error_code ec;
  http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
  RunUntilDone(ioc, deadline, "write");
  Check(ec, "write");

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) { ec = e; });
  RunUntilDone(ioc, deadline, "read");
  Check(ec, "read");
  return res;
}

std::optional<std::string> ReadString(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}
}  // namespace

std::vector<tcp::endpoint> SystemResolve(const std::string& host, const std::string& port) {
  boost::asio::io_context ioc;
  tcp::resolver resolver{ioc};
  auto results = resolver.resolve(host, port);
  return std::vector<tcp::endpoint>(results.begin(), results.end());
}

std::string ParsedUrl::HostHeader() const {
  bool default_port = (scheme == "https" && port == "443") || (scheme == "http" && port == "80");
  return default_port ? host : host + ":" + port;
}

ParsedUrl ParseUrl(const std::string& url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    throw std::invalid_argument("URL 스킴이 없습니다: " + url);
  }
  ParsedUrl parsed;
  parsed.scheme = url.substr(0, scheme_end);
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw std::invalid_argument("지원하지 않는 URL 스킴입니다: " + parsed.scheme);
  }
  auto authority_start = scheme_end + 3;
  auto path_start = url.find_first_of("/?", authority_start);
  auto authority = url.substr(authority_start, path_start == std::string::npos ? std::string::npos
                                                                               : path_start - authority_start);
  auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    parsed.host = authority.substr(0, colon);
    parsed.port = authority.substr(colon + 1);
  } else {
    parsed.host = authority;
    parsed.port = parsed.scheme == "https" ? "443" : "80";
  }
  if (parsed.host.empty() || parsed.port.empty()) {
    throw std::invalid_argument("URL 호스트가 없습니다: " + url);
  }
  parsed.target = path_start == std::string::npos ? "/" : url.substr(path_start);
  if (parsed.target.front() == '?') {
    parsed.target.insert(parsed.target.begin(), '/');
  }
  return parsed;
}

TokenExchangeResult ParseTokenResponse(unsigned status, const std::string& body) {
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    throw TokenExchangeError("토큰 응답이 JSON 객체가 아닙니다", status);
  }
  TokenExchangeResult result;
  result.http_status = status;
  result.access_token = ReadString(json, "access_token");
  result.error = ReadString(json, "error");
  result.error_description = ReadString(json, "error_description");
  result.token_type = ReadString(json, "token_type").value_or("");
  result.scope = ReadString(json, "scope").value_or("");
  if (status >= 500 && !result.error) {
    throw TokenExchangeError("토큰 엔드포인트 서버 오류", status);
  }
  return result;
}

HttpTokenExchanger::HttpTokenExchanger(const std::string& token_url, std::chrono::milliseconds timeout,
                                       EndpointResolver resolver)
    : endpoint_(ParseUrl(token_url)),
      timeout_(timeout),
      resolver_(std::move(resolver)),
      ssl_ctx_(boost::asio::ssl::context::tlsv12_client) {
  ssl_ctx_.set_default_verify_paths();
  ssl_ctx_.set_verify_mode(boost::asio::ssl::verify_peer);
}

TokenExchangeResult HttpTokenExchanger::Exchange(const TokenExchangeRequest& request) {
  nlohmann::json body{{"client_id", request.client_id},
                      {"client_secret", request.client_secret},
                      {"code", request.code},
                      {"redirect_uri", request.redirect_uri}};
  Request req{http::verb::post, endpoint_.target, 11};
  req.set(http::field::host, endpoint_.HostHeader());
  req.set(http::field::user_agent, "oauth-broker");
  req.set(http::field::content_type, "application/json");
  req.set(http::field::accept, "application/json");
  req.body() = body.dump();
  req.prepare_payload();

  auto res = endpoint_.scheme == "https" ? SendTls(req) : SendPlain(req);
  return ParseTokenResponse(res.result_int(), res.body());
}

HttpTokenExchanger::Response HttpTokenExchanger::SendPlain(Request& req) {
  boost::asio::io_context ioc;
  auto deadline = Clock::now() + timeout_;
  auto results = Resolve(resolver_, endpoint_, deadline);

  beast::tcp_stream stream{ioc};
  stream.expires_at(deadline);
  beast::error_code ec;
  stream.async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
  RunUntilDone(ioc, deadline, "connect");
  Check(ec, "connect");

  auto res = RoundTrip(ioc, stream, req, deadline);
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  return res;
}

HttpTokenExchanger::Response HttpTokenExchanger::SendTls(Request& req) {
  boost::asio::io_context ioc;
  auto deadline = Clock::now() + timeout_;
  auto results = Resolve(resolver_, endpoint_, deadline);

  beast::ssl_stream<beast::tcp_stream> stream{ioc, ssl_ctx_};
  if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
    throw TokenExchangeError("TLS SNI 설정 실패");
  }
  stream.set_verify_callback(boost::asio::ssl::host_name_verification(endpoint_.host));

  beast::get_lowest_layer(stream).expires_at(deadline);
  beast::error_code ec;
  beast::get_lowest_layer(stream).async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
  RunUntilDone(ioc, deadline, "connect");
  Check(ec, "connect");

  stream.async_handshake(boost::asio::ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
  RunUntilDone(ioc, deadline, "tls handshake");
  Check(ec, "tls handshake");

  auto res = RoundTrip(ioc, stream, req, deadline);
  // 응답을 이미 받았으므로 TLS close_notify 교환은 생략하고 소켓만 닫는다.
  beast::get_lowest_layer(stream).close();
  return res;
}

}  // namespace broker
