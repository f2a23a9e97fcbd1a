/*
 * 설명: CSRF state 토큰 생성/파싱과 상수 시간 비교를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/state_token_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace broker {

constexpr char kStateSeparator = ':';

struct StateToken {
  std::string random;
  std::string project;
};

// OpenSSL RAND_bytes 기반. 16바이트 미만 요청은 16바이트로 올리고 1024바이트를 넘으면 std::invalid_argument.
std::string GenerateRandomHex(std::size_t bytes);

std::string ComposeStateToken(const std::string& random, const std::string& project);
StateToken ParseStateToken(const std::string& token, const std::string& default_project);

bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs);

}  // namespace broker
