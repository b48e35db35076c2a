/*
 * 설명: 연결 생존 점검과 전달 기록 정리 타이머를 이벤트 루프에서 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/health_monitor_test.cpp
 */
#include "presence/health_monitor.hpp"

#include <boost/asio/post.hpp>

namespace presence {

HealthMonitor::HealthMonitor(const LoopExecutor& executor, std::shared_ptr<PresenceState> state,
                             std::shared_ptr<Observability> observability, const HealthMonitorConfig& config)
    : executor_(executor), state_(std::move(state)),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>()), config_(config),
      liveness_timer_(executor), prune_timer_(executor) {}

void HealthMonitor::Start() {
  if (running_.exchange(true)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(executor_, [self]() {
    self->ScheduleLiveness();
    self->SchedulePrune();
  });
}

void HealthMonitor::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(executor_, [self]() {
    self->liveness_timer_.cancel();
    self->prune_timer_.cancel();
  });
}

std::vector<std::string> HealthMonitor::SweepConnections() {
  auto reaped = state_->connections.ReapDead();
  for (const auto& user_id : reaped) {
    observability_->Log(LogContext{.level = LogLevel::kWarn, .user_id = user_id, .name = "health.reaped"});
  }
  observability_->AddReaped(reaped.size());
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .name = "health.sweep",
                                 .detail = ToJson(observability_->Snapshot(state_->Stats()))});
  return reaped;
}

std::size_t HealthMonitor::PruneDeliveries(std::chrono::system_clock::time_point now) {
  auto removed = state_->ledger.PruneOlderThan(config_.delivery_retention, now);
  observability_->AddPruned(removed);
  if (removed > 0) {
    observability_->Log(
        LogContext{.level = LogLevel::kInfo, .name = "health.pruned", .detail = {{"records", removed}}});
  }
  return removed;
}

void HealthMonitor::ScheduleLiveness() {
  liveness_timer_.expires_after(config_.liveness_interval);
  auto self = shared_from_this();
  liveness_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec || !self->running_) {
      return;
    }
    self->SweepConnections();
    self->ScheduleLiveness();
  });
}

void HealthMonitor::SchedulePrune() {
  prune_timer_.expires_after(config_.prune_interval);
  auto self = shared_from_this();
  prune_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec || !self->running_) {
      return;
    }
    self->PruneDeliveries(std::chrono::system_clock::now());
    self->SchedulePrune();
  });
}

}  // namespace presence
