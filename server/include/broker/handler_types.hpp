/*
 * 설명: 호스트 어댑터와 무관한 요청/응답 값 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/login_handler_test.cpp, server/tests/unit/callback_handler_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>

#include "broker/cookie.hpp"
#include "broker/origin_resolver.hpp"

namespace broker {

using QueryMap = std::unordered_map<std::string, std::string>;

struct HandlerRequest {
  boost::beast::http::verb method{boost::beast::http::verb::get};
  std::string path;
  QueryMap query;
  CookieMap cookies;
  std::string origin;
  std::string trace_id;

  std::optional<std::string> Query(const std::string& key) const;
  std::optional<std::string> Cookie(const std::string& name) const;
};

struct HandlerResponse {
  boost::beast::http::status status{boost::beast::http::status::ok};
  HeaderList headers;
  std::vector<std::string> cookies;
  std::string body;

  void SetHeader(const std::string& name, const std::string& value);
  void AddHeaders(const HeaderList& extra);
  std::optional<std::string> Header(const std::string& name) const;
};

HandlerResponse MakeJsonResponse(boost::beast::http::status status, const nlohmann::json& body);
HandlerResponse MakeHtmlResponse(boost::beast::http::status status, std::string html);

// 이름과 값을 퍼센트 디코딩한다('+'는 공백). 반복된 키는 첫 값을 유지한다.
QueryMap ParseQueryString(std::string_view query);

}  // namespace broker
