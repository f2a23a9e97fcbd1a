/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/oauth_flow_test.cpp
 */
#include "broker/app.hpp"

#include <algorithm>
#include <chrono>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "broker/http_session.hpp"

namespace broker {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<LoginInitiator> login, std::shared_ptr<CallbackProcessor> callback,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc),
        acceptor_(boost::asio::make_strand(ioc)),
        config_(config),
        login_(std::move(login)),
        callback_(std::move(callback)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
    port_ = acceptor_.local_endpoint().port();
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short Port() const { return port_; }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->login_, self->callback_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<LoginInitiator> login_;
  std::shared_ptr<CallbackProcessor> callback_;
  std::shared_ptr<Observability> observability_;
  unsigned short port_{0};
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<TokenExchanger> exchanger)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  resolver_ = std::make_shared<OriginResolver>(config_, observability_);
  exchanger_ = exchanger ? std::move(exchanger)
                         : std::make_shared<HttpTokenExchanger>(
                               config_.provider.token_url, std::chrono::milliseconds(config_.token_exchange_timeout_ms));
  login_ = std::make_shared<LoginInitiator>(config_, resolver_, observability_);
  callback_ = std::make_shared<CallbackProcessor>(config_, resolver_, exchanger_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Start() {
  if (running_) {
    return;
  }
  // 바인드가 실패하면 running_은 그대로 두어 재시도할 수 있게 한다.
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, login_, callback_, observability_);
  running_ = true;
  listener_->Run();
  observability_->Event(LogLevel::kInfo, "server_started", {{"port", listener_->Port()}});

  // 토큰 교환이 워커 스레드를 막을 수 있으므로 최소 2개는 둔다.
  const unsigned int thread_count = std::max(2u, std::thread::hardware_concurrency());
  for (unsigned int i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Run() {
  Start();
  try {
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kError, "server_failed", {{"reason", ex.what()}});
  }
  Stop();
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (!worker.joinable()) {
      continue;
    }
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }
  workers_.clear();
  observability_->Event(LogLevel::kInfo, "server_stopped");
}

unsigned short ServerApp::Port() const { return listener_ ? listener_->Port() : config_.port; }

}  // namespace broker
