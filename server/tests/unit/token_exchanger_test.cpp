#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <gtest/gtest.h>

#include "broker/token_exchanger.hpp"

TEST(TokenUrlTest, ParsesDefaultPorts) {
  auto https = broker::ParseUrl("https://github.com/login/oauth/access_token");
  EXPECT_EQ(https.scheme, "https");
  EXPECT_EQ(https.host, "github.com");
  EXPECT_EQ(https.port, "443");
  EXPECT_EQ(https.target, "/login/oauth/access_token");
  EXPECT_EQ(https.HostHeader(), "github.com");

  auto http = broker::ParseUrl("http://127.0.0.1:8081");
  EXPECT_EQ(http.port, "8081");
  EXPECT_EQ(http.target, "/");
  EXPECT_EQ(http.HostHeader(), "127.0.0.1:8081");
}

TEST(TokenUrlTest, KeepsQueryInTarget) {
  auto parsed = broker::ParseUrl("http://idp.local?tenant=a");
  EXPECT_EQ(parsed.host, "idp.local");
  EXPECT_EQ(parsed.target, "/?tenant=a");
}

TEST(TokenUrlTest, RejectsUnsupportedUrls) {
  EXPECT_THROW(broker::ParseUrl("github.com/login"), std::invalid_argument);
  EXPECT_THROW(broker::ParseUrl("ftp://github.com/login"), std::invalid_argument);
  EXPECT_THROW(broker::ParseUrl("https:///path"), std::invalid_argument);
  EXPECT_THROW(broker::ParseUrl("http://host:/path"), std::invalid_argument);
}

TEST(TokenResponseTest, ReadsAccessToken) {
  auto result = broker::ParseTokenResponse(
      200, R"({"access_token":"gho_abc","token_type":"bearer","scope":"repo,user"})");
  ASSERT_TRUE(result.access_token.has_value());
  EXPECT_EQ(*result.access_token, "gho_abc");
  EXPECT_EQ(result.token_type, "bearer");
  EXPECT_EQ(result.scope, "repo,user");
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(result.http_status, 200u);
}

TEST(TokenResponseTest, ProviderErrorIsReturnedNotThrown) {
  auto result = broker::ParseTokenResponse(
      200, R"({"error":"bad_verification_code","error_description":"The code passed is incorrect or expired."})");
  EXPECT_FALSE(result.access_token.has_value());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, "bad_verification_code");
  EXPECT_EQ(result.error_description.value_or(""), "The code passed is incorrect or expired.");
}

TEST(TokenResponseTest, EmptyOrNonStringTokenCountsAsMissing) {
  EXPECT_FALSE(broker::ParseTokenResponse(200, R"({"access_token":""})").access_token.has_value());
  EXPECT_FALSE(broker::ParseTokenResponse(200, R"({"access_token":42})").access_token.has_value());
  EXPECT_FALSE(broker::ParseTokenResponse(200, "{}").access_token.has_value());
}

TEST(TokenResponseTest, NonJsonBodyThrows) {
  EXPECT_THROW(broker::ParseTokenResponse(200, "access_token=abc&scope=repo"), broker::TokenExchangeError);
  EXPECT_THROW(broker::ParseTokenResponse(200, "[]"), broker::TokenExchangeError);
  try {
    broker::ParseTokenResponse(502, "<html>Bad Gateway</html>");
    FAIL() << "expected TokenExchangeError";
  } catch (const broker::TokenExchangeError& ex) {
    EXPECT_EQ(ex.http_status, 502u);
  }
}

TEST(TokenResponseTest, ServerErrorWithoutErrorFieldThrows) {
  EXPECT_THROW(broker::ParseTokenResponse(503, "{}"), broker::TokenExchangeError);
  auto result = broker::ParseTokenResponse(500, R"({"error":"temporarily_unavailable"})");
  EXPECT_EQ(result.error.value_or(""), "temporarily_unavailable");
}

TEST(HttpTokenExchangerTest, RefusedConnectionThrows) {
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::acceptor acceptor(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});
  auto port = acceptor.local_endpoint().port();
  acceptor.close();

  broker::HttpTokenExchanger exchanger("http://127.0.0.1:" + std::to_string(port) + "/token",
                                       std::chrono::milliseconds(1000));
  EXPECT_THROW(exchanger.Exchange({"id", "secret", "code", "http://localhost/cb"}), broker::TokenExchangeError);
}

TEST(HttpTokenExchangerTest, SilentServerTimesOut) {
  // accept하지 않아도 backlog로 연결은 성립하지만 응답은 오지 않는다.
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::acceptor acceptor(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});
  auto port = acceptor.local_endpoint().port();

  broker::HttpTokenExchanger exchanger("http://127.0.0.1:" + std::to_string(port) + "/token",
                                       std::chrono::milliseconds(200));
  auto started = std::chrono::steady_clock::now();
  EXPECT_THROW(exchanger.Exchange({"id", "secret", "code", "http://localhost/cb"}), broker::TokenExchangeError);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(HttpTokenExchangerTest, SlowNameResolutionHonorsDeadline) {
  // 해석이 3초 걸려도 교환은 200ms 예산 안에서 끝나야 한다.
  auto stalled = [](const std::string&, const std::string&) {
    std::this_thread::sleep_for(std::chrono::seconds(3));
    return std::vector<boost::asio::ip::tcp::endpoint>{};
  };
  broker::HttpTokenExchanger exchanger("http://idp.invalid/token", std::chrono::milliseconds(200), stalled);
  auto started = std::chrono::steady_clock::now();
  try {
    exchanger.Exchange({"id", "secret", "code", "http://localhost/cb"});
    FAIL() << "expected TokenExchangeError";
  } catch (const broker::TokenExchangeError& ex) {
    EXPECT_NE(std::string(ex.what()).find("resolve"), std::string::npos);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
}

TEST(HttpTokenExchangerTest, ResolverFailureIsReported) {
  auto failing = [](const std::string& host, const std::string&) -> std::vector<boost::asio::ip::tcp::endpoint> {
    throw std::runtime_error("no such host: " + host);
  };
  broker::HttpTokenExchanger exchanger("http://idp.invalid/token", std::chrono::milliseconds(1000), failing);
  EXPECT_THROW(exchanger.Exchange({"id", "secret", "code", "http://localhost/cb"}), broker::TokenExchangeError);
}
