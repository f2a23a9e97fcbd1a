/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 */
#include "broker/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace broker {

namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}
}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : min_level_(min_level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementLoginRedirect() { login_redirects_.fetch_add(1); }

void Observability::IncrementCallbackSuccess() { callback_success_.fetch_add(1); }

void Observability::IncrementCallbackFailure() { callback_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.login_redirects = login_redirects_.load();
  snapshot.callback_success = callback_success_.load();
  snapshot.callback_failures = callback_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["event"] = "http_request";
  log_json["method"] = ctx.method;
  log_json["path"] = ctx.path;
  log_json["status"] = ctx.status;
  log_json["latencyMs"] = ctx.latency_ms;
  Emit(ctx.status >= 500 ? LogLevel::kError : LogLevel::kInfo, log_json);
}

void Observability::Event(LogLevel level, std::string_view event, const nlohmann::json& fields,
                          const std::string& trace_id) const {
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["event"] = event;
  if (!trace_id.empty()) {
    log_json["traceId"] = trace_id;
  }
  Emit(level, log_json);
}

void Observability::SetSink(LogSink sink) { sink_ = std::move(sink); }

void Observability::Emit(LogLevel level, const nlohmann::json& line) const {
  if (level < min_level_) {
    return;
  }
  nlohmann::json out = line;
  out["level"] = LogLevelName(level);
  out["timestamp"] = CurrentTimestamp();
  if (sink_) {
    sink_(level, out);
    return;
  }
  // 요청에서 온 문자열이 UTF-8이 아니어도 로그 출력이 예외로 끝나지 않게 한다.
  auto text = out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (level >= LogLevel::kWarn) {
    std::cerr << text << std::endl;
  } else {
    std::cout << text << std::endl;
  }
}

}  // namespace broker
