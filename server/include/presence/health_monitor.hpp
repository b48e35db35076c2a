/*
 * 설명: 주기적으로 끊긴 채널을 연결 레지스트리에서 정리하고 보존 기간이 지난 전달 기록을 삭제한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/health_monitor_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/steady_timer.hpp>

#include "presence/cancellable_timer.hpp"
#include "presence/observability.hpp"
#include "presence/presence_state.hpp"

namespace presence {

struct HealthMonitorConfig {
  std::chrono::seconds liveness_interval{std::chrono::seconds(30)};
  std::chrono::seconds prune_interval{std::chrono::seconds(300)};
  std::chrono::seconds delivery_retention{std::chrono::seconds(3600)};
};

class HealthMonitor : public std::enable_shared_from_this<HealthMonitor> {
 public:
  HealthMonitor(const LoopExecutor& executor, std::shared_ptr<PresenceState> state,
                std::shared_ptr<Observability> observability, const HealthMonitorConfig& config);

  void Start();
  void Stop();

  std::vector<std::string> SweepConnections();
  std::size_t PruneDeliveries(std::chrono::system_clock::time_point now);

 private:
  void ScheduleLiveness();
  void SchedulePrune();

  LoopExecutor executor_;
  std::shared_ptr<PresenceState> state_;
  std::shared_ptr<Observability> observability_;
  HealthMonitorConfig config_;
  boost::asio::steady_timer liveness_timer_;
  boost::asio::steady_timer prune_timer_;
  std::atomic<bool> running_{false};
};

}  // namespace presence
