/*
 * 설명: CSRF state 토큰의 난수부 생성과 프로젝트 분리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/state_token_test.cpp
 */
#include "broker/state_token.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/rand.h>

namespace broker {

namespace {
constexpr std::size_t kMinRandomBytes = 16;
constexpr std::size_t kMaxRandomBytes = 1024;

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string GenerateRandomHex(std::size_t bytes) {
  if (bytes > kMaxRandomBytes) {
    throw std::invalid_argument("요청한 난수 길이가 너무 깁니다: " + std::to_string(bytes));
  }
  std::vector<unsigned char> buffer(std::max(bytes, kMinRandomBytes));
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes 실패: 안전한 난수를 만들 수 없습니다");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

std::string ComposeStateToken(const std::string& random, const std::string& project) {
  return random + kStateSeparator + project;
}

StateToken ParseStateToken(const std::string& token, const std::string& default_project) {
  StateToken parsed;
  auto sep = token.find(kStateSeparator);
  if (sep == std::string::npos) {
    parsed.random = token;
    parsed.project = default_project;
    return parsed;
  }
  parsed.random = token.substr(0, sep);
  parsed.project = token.substr(sep + 1);
  if (parsed.project.empty()) {
    parsed.project = default_project;
  }
  return parsed;
}

bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  if (lhs.empty()) {
    return true;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace broker
