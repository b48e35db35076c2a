#include <chrono>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <gtest/gtest.h>

#include "presence/cancellable_timer.hpp"
#include "presence/typing_tracker.hpp"

using namespace std::chrono_literals;

class TypingTrackerFixture : public ::testing::Test {
 protected:
  TypingTrackerFixture() : strand_(boost::asio::make_strand(ioc_)), tracker_(strand_, 300ms) {
    tracker_.SetExpiryCallback([this](const std::string& room_id, const std::string& user_id) {
      expired_.emplace_back(room_id, user_id);
    });
  }

  void RunFor(std::chrono::milliseconds duration) {
    ioc_.restart();
    ioc_.run_for(duration);
  }

  boost::asio::io_context ioc_;
  presence::LoopExecutor strand_;
  presence::TypingTracker tracker_;
  std::vector<std::pair<std::string, std::string>> expired_;
};

TEST_F(TypingTrackerFixture, StartArmsAndExpiresOnce) {
  EXPECT_TRUE(tracker_.Start("r1", "alice"));
  EXPECT_TRUE(tracker_.IsTyping("r1", "alice"));
  EXPECT_EQ(tracker_.TypingIn("r1"), (std::set<std::string>{"alice"}));

  RunFor(600ms);
  ASSERT_EQ(expired_.size(), 1u);
  EXPECT_EQ(expired_[0].first, "r1");
  EXPECT_EQ(expired_[0].second, "alice");
  EXPECT_FALSE(tracker_.IsTyping("r1", "alice"));
  EXPECT_EQ(tracker_.ActiveCount(), 0u);
}

TEST_F(TypingTrackerFixture, RepeatedStartDebouncesFromLastStart) {
  EXPECT_TRUE(tracker_.Start("r1", "alice"));
  RunFor(150ms);
  EXPECT_FALSE(tracker_.Start("r1", "alice"));

  // 첫 start 기준 만료 시각(300ms)은 지났지만 두 번째 start 기준으로는 아직이다.
  RunFor(200ms);
  EXPECT_TRUE(expired_.empty());
  EXPECT_TRUE(tracker_.IsTyping("r1", "alice"));

  RunFor(400ms);
  EXPECT_EQ(expired_.size(), 1u);
  EXPECT_FALSE(tracker_.IsTyping("r1", "alice"));
}

TEST_F(TypingTrackerFixture, ExplicitStopCancelsTimer) {
  tracker_.Start("r1", "alice");
  EXPECT_TRUE(tracker_.Stop("r1", "alice"));
  EXPECT_FALSE(tracker_.Stop("r1", "alice"));
  RunFor(500ms);
  EXPECT_TRUE(expired_.empty());
}

TEST_F(TypingTrackerFixture, StopAllReturnsEveryRoomOfUser) {
  tracker_.Start("r1", "alice");
  tracker_.Start("r2", "alice");
  tracker_.Start("r1", "bob");

  auto rooms = tracker_.StopAll("alice");
  std::set<std::string> room_set(rooms.begin(), rooms.end());
  EXPECT_EQ(room_set, (std::set<std::string>{"r1", "r2"}));
  EXPECT_EQ(tracker_.ActiveCount(), 1u);
  EXPECT_EQ(tracker_.TypingIn("r1"), (std::set<std::string>{"bob"}));

  RunFor(600ms);
  ASSERT_EQ(expired_.size(), 1u);
  EXPECT_EQ(expired_[0].second, "bob");
}

TEST_F(TypingTrackerFixture, NonPositiveDebounceUsesDefault) {
  presence::TypingTracker tracker(strand_, 0ms);
  EXPECT_EQ(tracker.Debounce(), presence::TypingTracker::kDefaultDebounce);
}

TEST(CancellableTimerTest, CancelledTimerNeverFires) {
  boost::asio::io_context ioc;
  presence::LoopExecutor strand = boost::asio::make_strand(ioc);
  int fired = 0;
  presence::CancellableTimer timer(strand);
  timer.Start(50ms, [&fired]() { ++fired; });
  EXPECT_TRUE(timer.Armed());
  timer.Cancel();
  EXPECT_FALSE(timer.Armed());
  ioc.run_for(200ms);
  EXPECT_EQ(fired, 0);
}

TEST(CancellableTimerTest, ResetReplacesPendingWait) {
  boost::asio::io_context ioc;
  presence::LoopExecutor strand = boost::asio::make_strand(ioc);
  int fired = 0;
  presence::CancellableTimer timer(strand);
  timer.Start(50ms, [&fired]() { ++fired; });
  timer.Reset(100ms);
  timer.Reset(100ms);
  ioc.run_for(400ms);
  EXPECT_EQ(fired, 1);
  EXPECT_FALSE(timer.Armed());
}

TEST(CancellableTimerTest, DestroyedTimerDoesNotFire) {
  boost::asio::io_context ioc;
  presence::LoopExecutor strand = boost::asio::make_strand(ioc);
  int fired = 0;
  {
    presence::CancellableTimer timer(strand);
    timer.Start(20ms, [&fired]() { ++fired; });
  }
  ioc.run_for(100ms);
  EXPECT_EQ(fired, 0);
}
