/*
 * 설명: Set-Cookie 직렬화와 Cookie 헤더 파싱, 퍼센트 인코딩을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/cookie_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "broker/config.hpp"

namespace broker {

struct CookieOptions {
  bool http_only{true};
  bool secure{false};
  std::string same_site{"Lax"};
  std::optional<std::size_t> max_age;
  std::string path{"/"};
  std::string domain;
};

using CookieMap = std::unordered_map<std::string, std::string>;

std::string PercentEncode(std::string_view value);
std::string PercentDecode(std::string_view value, bool plus_as_space = false);

std::string SerializeCookie(std::string_view name, std::string_view value, const CookieOptions& options);
CookieMap ParseCookies(std::string_view header);
std::optional<std::string> FindCookie(std::string_view header, const std::string& name);

CookieOptions StateCookieOptions(const AppConfig& config);
CookieOptions ExpiredStateCookieOptions(const AppConfig& config);

}  // namespace broker
