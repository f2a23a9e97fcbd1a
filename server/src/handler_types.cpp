/*
 * 설명: 요청/응답 값 타입의 보조 함수와 쿼리 문자열 파서를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/login_handler_test.cpp
 */
#include "broker/handler_types.hpp"

#include <boost/beast/core/string.hpp>

namespace broker {

std::optional<std::string> HandlerRequest::Query(const std::string& key) const {
  auto it = query.find(key);
  if (it == query.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> HandlerRequest::Cookie(const std::string& name) const {
  auto it = cookies.find(name);
  if (it == cookies.end()) {
    return std::nullopt;
  }
  return it->second;
}

void HandlerResponse::SetHeader(const std::string& name, const std::string& value) {
  for (auto& header : headers) {
    if (boost::beast::iequals(header.first, name)) {
      header.second = value;
      return;
    }
  }
  headers.emplace_back(name, value);
}

void HandlerResponse::AddHeaders(const HeaderList& extra) {
  for (const auto& header : extra) {
    SetHeader(header.first, header.second);
  }
}

std::optional<std::string> HandlerResponse::Header(const std::string& name) const {
  for (const auto& header : headers) {
    if (boost::beast::iequals(header.first, name)) {
      return header.second;
    }
  }
  return std::nullopt;
}

HandlerResponse MakeJsonResponse(boost::beast::http::status status, const nlohmann::json& body) {
  HandlerResponse response;
  response.status = status;
  response.SetHeader("Content-Type", "application/json; charset=utf-8");
  response.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return response;
}

HandlerResponse MakeHtmlResponse(boost::beast::http::status status, std::string html) {
  HandlerResponse response;
  response.status = status;
  response.SetHeader("Content-Type", "text/html; charset=utf-8");
  // 본문에 토큰이 들어갈 수 있으므로 어떤 캐시에도 남기지 않는다.
  response.SetHeader("Cache-Control", "no-store, no-cache, must-revalidate");
  response.SetHeader("Pragma", "no-cache");
  response.body = std::move(html);
  return response;
}

QueryMap ParseQueryString(std::string_view query) {
  QueryMap params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      auto name = PercentDecode(pair.substr(0, eq), true);
      auto value = eq == std::string_view::npos ? std::string{} : PercentDecode(pair.substr(eq + 1), true);
      if (!name.empty()) {
        params.emplace(std::move(name), std::move(value));
      }
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

}  // namespace broker
