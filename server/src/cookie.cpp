/*
 * 설명: 쿠키 속성 직렬화와 요청 Cookie 헤더 디코딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/cookie_test.cpp
 */
#include "broker/cookie.hpp"

namespace broker {

namespace {
constexpr char kHexDigits[] = "0123456789ABCDEF";

bool IsUnreserved(unsigned char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '!':
    case '~':
    case '*':
    case '\'':
    case '(':
    case ')':
      return true;
    default:
      return false;
  }
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string_view TrimView(std::string_view value) {
  const auto begin = value.find_first_not_of(" \t");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}
}  // namespace

std::string PercentEncode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    auto c = static_cast<unsigned char>(ch);
    if (IsUnreserved(c)) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(kHexDigits[c >> 4]);
      out.push_back(kHexDigits[c & 0x0F]);
    }
  }
  return out;
}

std::string PercentDecode(std::string_view value, bool plus_as_space) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '%' && i + 2 < value.size()) {
      int hi = HexValue(value[i + 1]);
      int lo = HexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out.push_back(' ');
      continue;
    }
    // 잘못된 퍼센트 시퀀스는 그대로 남긴다.
    out.push_back(c);
  }
  return out;
}

std::string SerializeCookie(std::string_view name, std::string_view value, const CookieOptions& options) {
  std::string cookie;
  cookie.append(name).append("=").append(PercentEncode(value));
  if (options.http_only) {
    cookie += "; HttpOnly";
  }
  if (options.secure) {
    cookie += "; Secure";
  }
  if (!options.same_site.empty()) {
    cookie += "; SameSite=" + options.same_site;
  }
  if (options.max_age) {
    cookie += "; Max-Age=" + std::to_string(*options.max_age);
  }
  if (!options.path.empty()) {
    cookie += "; Path=" + options.path;
  }
  if (!options.domain.empty()) {
    cookie += "; Domain=" + options.domain;
  }
  return cookie;
}

CookieMap ParseCookies(std::string_view header) {
  CookieMap cookies;
  std::size_t pos = 0;
  while (pos < header.size()) {
    auto semi = header.find(';', pos);
    auto piece = TrimView(header.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
    if (!piece.empty()) {
      auto eq = piece.find('=');
      auto name = TrimView(piece.substr(0, eq));
      std::string_view raw_value = eq == std::string_view::npos ? std::string_view{} : TrimView(piece.substr(eq + 1));
      if (!name.empty()) {
        // 같은 이름이 반복되면 먼저 나온 값을 유지한다.
        cookies.emplace(std::string(name), PercentDecode(raw_value));
      }
    }
    if (semi == std::string_view::npos) {
      break;
    }
    pos = semi + 1;
  }
  return cookies;
}

std::optional<std::string> FindCookie(std::string_view header, const std::string& name) {
  auto cookies = ParseCookies(header);
  auto it = cookies.find(name);
  if (it == cookies.end()) {
    return std::nullopt;
  }
  return it->second;
}

CookieOptions StateCookieOptions(const AppConfig& config) {
  CookieOptions options;
  options.http_only = true;
  options.secure = config.production;
  options.same_site = "Lax";
  options.max_age = config.cookie_max_age_seconds;
  options.path = "/";
  return options;
}

CookieOptions ExpiredStateCookieOptions(const AppConfig& config) {
  auto options = StateCookieOptions(config);
  options.max_age = 0;
  return options;
}

}  // namespace broker
