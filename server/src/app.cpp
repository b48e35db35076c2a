/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리하고 환경변수 설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/presence_flow_test.cpp
 */
#include "presence/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "presence/http_session.hpp"
#include "presence/user_directory.hpp"

namespace presence {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<IdentityResolver> identity_resolver, std::shared_ptr<PresenceCoordinator> coordinator,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        identity_resolver_(std::move(identity_resolver)), coordinator_(std::move(coordinator)),
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
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->identity_resolver_,
                                          self->coordinator_, self->observability_)
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
  std::shared_ptr<IdentityResolver> identity_resolver_;
  std::shared_ptr<PresenceCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config) : ServerApp(config, nullptr) {}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<IdentityResolver> identity_resolver)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)),
      loop_(boost::asio::make_strand(ioc_)), identity_resolver_(std::move(identity_resolver)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  if (!identity_resolver_) {
    std::shared_ptr<UserDirectory> directory;
    if (config.identity_lookup == "mariadb") {
      DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
      db_client_ = std::make_shared<MariaDbClient>(db_config);
      directory = std::make_shared<MariaDbUserDirectory>(db_client_);
    }
    identity_resolver_ = std::make_shared<JwtIdentityResolver>(config.jwt_secret, directory, observability_);
  }

  PresenceLimits limits;
  limits.offline_queue_capacity = config.offline_queue_capacity;
  limits.typing_debounce = std::chrono::milliseconds(config.typing_debounce_ms);
  state_ = std::make_shared<PresenceState>(loop_, limits);
  state_->connections.SetObservability(observability_);
  coordinator_ = std::make_shared<PresenceCoordinator>(loop_, state_, observability_);

  HealthMonitorConfig health_config;
  health_config.liveness_interval = std::chrono::seconds(config.liveness_sweep_seconds);
  health_config.prune_interval = std::chrono::seconds(config.delivery_prune_seconds);
  health_config.delivery_retention = std::chrono::seconds(config.delivery_retention_seconds);
  health_monitor_ = std::make_shared<HealthMonitor>(loop_, state_, observability_, health_config);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, identity_resolver_, coordinator_,
                                           observability_);
    listener_->Run();
    health_monitor_->Start();
    observability_->Log(LogContext{.level = LogLevel::kInfo,
                                   .name = "server.start",
                                   .detail = {{"port", config_.port}, {"identityLookup", config_.identity_lookup}}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(
        LogContext{.level = LogLevel::kError, .name = "server.run_failed", .detail = {{"error", ex.what()}}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(2u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  health_monitor_->Stop();
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
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.jwt_secret = get_env("JWT_SECRET", "");
  cfg.identity_lookup = get_env("IDENTITY_LOOKUP", "mariadb");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "256")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.offline_queue_capacity = static_cast<std::size_t>(std::stoul(get_env("OFFLINE_QUEUE_CAPACITY", "100")));
  cfg.typing_debounce_ms = static_cast<std::size_t>(std::stoul(get_env("TYPING_DEBOUNCE_MS", "3000")));
  cfg.liveness_sweep_seconds = static_cast<std::size_t>(std::stoul(get_env("LIVENESS_SWEEP_SECONDS", "30")));
  cfg.delivery_prune_seconds = static_cast<std::size_t>(std::stoul(get_env("DELIVERY_PRUNE_SECONDS", "300")));
  cfg.delivery_retention_seconds =
      static_cast<std::size_t>(std::stoul(get_env("DELIVERY_RETENTION_SECONDS", "3600")));
  return cfg;
}

}  // namespace presence
