/*
 * 설명: 프레즌스 서버 전체 수명주기(리스너, 코디네이터 strand, 헬스 모니터, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "presence/cancellable_timer.hpp"
#include "presence/config.hpp"
#include "presence/db_client.hpp"
#include "presence/health_monitor.hpp"
#include "presence/identity.hpp"
#include "presence/observability.hpp"
#include "presence/presence_coordinator.hpp"
#include "presence/presence_state.hpp"

namespace presence {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  // 테스트에서 자격 증명 해석기를 바꿔 끼울 때 쓴다.
  ServerApp(const AppConfig& config, std::shared_ptr<IdentityResolver> identity_resolver);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<PresenceState> GetState() { return state_; }
  std::shared_ptr<PresenceCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  LoopExecutor loop_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<IdentityResolver> identity_resolver_;
  std::shared_ptr<PresenceState> state_;
  std::shared_ptr<PresenceCoordinator> coordinator_;
  std::shared_ptr<HealthMonitor> health_monitor_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace presence
