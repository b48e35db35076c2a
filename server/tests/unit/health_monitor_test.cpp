#include <chrono>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <gtest/gtest.h>

#include "presence/health_monitor.hpp"
#include "recording_channel.hpp"

using namespace std::chrono_literals;
using presence_test::RecordingChannel;

class HealthMonitorFixture : public ::testing::Test {
 protected:
  HealthMonitorFixture()
      : strand_(boost::asio::make_strand(ioc_)),
        state_(std::make_shared<presence::PresenceState>(strand_, presence::PresenceLimits{})),
        observability_(std::make_shared<presence::Observability>(presence::LogLevel::kError)) {
    state_->connections.SetObservability(observability_);
  }

  std::shared_ptr<presence::HealthMonitor> MakeMonitor(std::chrono::seconds liveness, std::chrono::seconds prune) {
    presence::HealthMonitorConfig config;
    config.liveness_interval = liveness;
    config.prune_interval = prune;
    config.delivery_retention = 1h;
    return std::make_shared<presence::HealthMonitor>(strand_, state_, observability_, config);
  }

  boost::asio::io_context ioc_;
  presence::LoopExecutor strand_;
  std::shared_ptr<presence::PresenceState> state_;
  std::shared_ptr<presence::Observability> observability_;
};

TEST_F(HealthMonitorFixture, PruneRemovesRecordsPastRetention) {
  auto monitor = MakeMonitor(30s, 300s);
  auto now = std::chrono::system_clock::now();
  state_->ledger.MarkDelivered("old", "bob", now - 61min);
  state_->ledger.MarkDelivered("new", "bob", now - 59min);

  EXPECT_EQ(monitor->PruneDeliveries(now), 1u);
  EXPECT_FALSE(state_->ledger.Find("old", "bob").has_value());
  EXPECT_TRUE(state_->ledger.Find("new", "bob").has_value());
  EXPECT_EQ(observability_->Snapshot(state_->Stats()).delivery_records_pruned, 1u);
}

TEST_F(HealthMonitorFixture, SweepReapsDeadChannelsOnly) {
  auto monitor = MakeMonitor(30s, 300s);
  auto live = std::make_shared<RecordingChannel>();
  auto dead = std::make_shared<RecordingChannel>();
  state_->connections.Register(presence::UserIdentity{"alice", "Alice"}, live);
  state_->connections.Register(presence::UserIdentity{"bob", "Bob"}, dead);
  state_->rooms.Join("bob", "r1");
  dead->Close("network");

  auto reaped = monitor->SweepConnections();
  ASSERT_EQ(reaped.size(), 1u);
  EXPECT_EQ(reaped[0], "bob");
  EXPECT_TRUE(state_->connections.IsOnline("alice"));
  EXPECT_FALSE(state_->connections.IsOnline("bob"));
  // 방 멤버십은 유지되어 이후 메시지가 오프라인 큐에 쌓인다.
  EXPECT_EQ(state_->rooms.RoomsOf("bob"), (std::set<std::string>{"r1"}));

  auto snapshot = observability_->Snapshot(state_->Stats());
  EXPECT_EQ(snapshot.stale_connections_reaped, 1u);
  EXPECT_EQ(snapshot.websocket_active, 1u);
  EXPECT_TRUE(monitor->SweepConnections().empty());
}

TEST_F(HealthMonitorFixture, PeriodicSweepRunsUntilStopped) {
  auto monitor = MakeMonitor(1s, 1s);
  auto dead = std::make_shared<RecordingChannel>();
  state_->connections.Register(presence::UserIdentity{"bob", "Bob"}, dead);
  state_->ledger.MarkDelivered("old", "bob", std::chrono::system_clock::now() - 2h);
  dead->Close("network");

  monitor->Start();
  ioc_.run_for(1500ms);
  EXPECT_FALSE(state_->connections.IsOnline("bob"));
  EXPECT_EQ(state_->ledger.Size(), 0u);

  monitor->Stop();
  ioc_.restart();
  ioc_.run_for(100ms);
  auto late = std::make_shared<RecordingChannel>();
  state_->connections.Register(presence::UserIdentity{"carol", "Carol"}, late);
  late->Close("network");
  ioc_.restart();
  ioc_.run_for(1500ms);
  EXPECT_EQ(state_->connections.Size(), 1u);
}
