/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/oauth_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "broker/callback_handler.hpp"
#include "broker/config.hpp"
#include "broker/login_handler.hpp"
#include "broker/observability.hpp"
#include "broker/origin_resolver.hpp"
#include "broker/token_exchanger.hpp"

namespace broker {

class Listener;

class ServerApp {
 public:
  // exchanger가 없으면 config.provider.token_url로 HttpTokenExchanger를 만든다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<TokenExchanger> exchanger = nullptr);
  ~ServerApp();

  // 리스너를 열고 워커 스레드를 띄운 뒤 바로 반환한다.
  void Start();
  // Start 후 현재 스레드에서도 io_context를 돌리고, 멈추면 워커를 정리한다. 바인드 실패는 예외로 전파된다.
  void Run();
  void Stop();

  unsigned short Port() const;
  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<OriginResolver> resolver_;
  std::shared_ptr<TokenExchanger> exchanger_;
  std::shared_ptr<LoginInitiator> login_;
  std::shared_ptr<CallbackProcessor> callback_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace broker
