/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/origin_resolver_test.cpp, server/tests/unit/callback_handler_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace broker {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);
const char* LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string method;
  std::string path;
  unsigned status{0};
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t login_redirects{0};
  std::uint64_t callback_success{0};
  std::uint64_t callback_failures{0};
};

class Observability {
 public:
  using LogSink = std::function<void(LogLevel, const nlohmann::json&)>;

  explicit Observability(LogLevel min_level = LogLevel::kInfo);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementLoginRedirect();
  void IncrementCallbackSuccess();
  void IncrementCallbackFailure();
  MetricsSnapshot Snapshot() const;

  // 요청 단위 접근 로그
  void Log(const LogContext& ctx) const;
  void Event(LogLevel level, std::string_view event, const nlohmann::json& fields = nlohmann::json::object(),
             const std::string& trace_id = {}) const;

  // 기본 출력(stdout/stderr) 대신 로그 라인을 받는다. 요청 처리 시작 전에만 설정한다.
  void SetSink(LogSink sink);

 private:
  void Emit(LogLevel level, const nlohmann::json& line) const;

  LogLevel min_level_;
  LogSink sink_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> login_redirects_{0};
  std::atomic<std::uint64_t> callback_success_{0};
  std::atomic<std::uint64_t> callback_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace broker
