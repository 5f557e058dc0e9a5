/*
 * 설명: 서버 수명주기와 리스닝 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "checkers/app.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "checkers/checkers_game.hpp"
#include "checkers/http_session.hpp"

namespace checkers {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), registry_(std::move(registry)),
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
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->registry_, self->observability_)
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
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  const int move_limit = config.noncapture_move_limit;
  registry_ = std::make_shared<SessionRegistry>(
      [move_limit]() -> std::unique_ptr<RuleEngine> { return std::make_unique<CheckersGame>(move_limit); });
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, registry_, observability_);
    listener_->Run();
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.name = "server.start";
    ctx.detail = {{"port", config_.port}, {"logLevel", config_.log_level}};
    observability_->Log(ctx);
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  unsigned int thread_count = static_cast<unsigned int>(config_.worker_threads);
  if (thread_count == 0) {
    thread_count = std::max(1u, std::thread::hardware_concurrency());
  }
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "32")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "262144")));
  cfg.ops_token = get_env("OPS_TOKEN", "");
  cfg.worker_threads = static_cast<std::size_t>(std::stoul(get_env("WORKER_THREADS", "0")));
  cfg.noncapture_move_limit = std::stoi(get_env("NONCAPTURE_MOVE_LIMIT", "40"));
  return cfg;
}

}  // namespace checkers
