/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/oauth_flow_test.cpp
 */
#include <csignal>
#include <iostream>

#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>

#include "broker/app.hpp"

int main() {
  using namespace broker;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const ConfigError& ex) {
    std::cerr << "설정 로딩 실패: " << ex.what() << "\n";
    return 1;
  }

  try {
    ServerApp app(config);
    auto observability = app.GetObservability();
    // 비밀값은 설정 여부만 기록한다.
    observability->Event(LogLevel::kInfo, "config_loaded",
                         {{"environment", config.production ? "production" : "development"},
                          {"apiBaseUrl", config.api_base_url},
                          {"clientId", config.provider.client_id.empty() ? "not set" : "set"},
                          {"clientSecret", config.provider.client_secret.empty() ? "not set" : "set"},
                          {"projects", config.projects.size()},
                          {"configErrors", ValidateConfig(config)}});

    boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
    signals.async_wait([&app](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "시그널 " << signal_number << " 수신, 종료를 준비합니다\n";
      app.GetContext().stop();
    });

    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 초기화 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
