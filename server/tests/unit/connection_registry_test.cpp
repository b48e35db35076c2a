#include <memory>

#include <gtest/gtest.h>

#include "presence/connection_registry.hpp"
#include "recording_channel.hpp"

using presence_test::RecordingChannel;

namespace {
presence::UserIdentity User(const std::string& id) { return presence::UserIdentity{id, id + "-name"}; }
}  // namespace

TEST(ConnectionRegistryTest, UnknownUserIsOfflineAndSendFails) {
  presence::ConnectionRegistry registry;
  EXPECT_FALSE(registry.IsOnline("ghost"));
  EXPECT_FALSE(registry.Send("ghost", "new_message", {{"x", 1}}));
  EXPECT_FALSE(registry.Unregister("ghost"));
  EXPECT_TRUE(registry.ListOnline().empty());
}

TEST(ConnectionRegistryTest, RegisterSendAndList) {
  presence::ConnectionRegistry registry;
  auto alice = std::make_shared<RecordingChannel>();
  auto bob = std::make_shared<RecordingChannel>();
  EXPECT_EQ(registry.Register(User("alice"), alice), nullptr);
  registry.Register(User("bob"), bob);

  EXPECT_TRUE(registry.IsOnline("alice"));
  EXPECT_EQ(registry.ListOnline(), (std::set<std::string>{"alice", "bob"}));
  EXPECT_TRUE(registry.Send("alice", "user_joined", {{"roomId", "r1"}}));
  ASSERT_EQ(alice->Count("user_joined"), 1u);
  EXPECT_EQ(alice->Events("user_joined")[0]["p"]["roomId"], "r1");
  EXPECT_EQ(bob->Frames().size(), 0u);

  auto found = registry.Find("bob");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->user.display_name, "bob-name");
  EXPECT_EQ(found->raw, bob.get());
}

TEST(ConnectionRegistryTest, RegisterReplacesAndReturnsPreviousChannel) {
  presence::ConnectionRegistry registry;
  auto first = std::make_shared<RecordingChannel>();
  auto second = std::make_shared<RecordingChannel>();
  registry.Register(User("alice"), first);
  auto previous = registry.Register(User("alice"), second);
  EXPECT_EQ(previous.get(), first.get());
  EXPECT_EQ(registry.Size(), 1u);

  registry.Send("alice", "ping", nlohmann::json::object());
  EXPECT_EQ(first->Frames().size(), 0u);
  EXPECT_EQ(second->Frames().size(), 1u);
}

TEST(ConnectionRegistryTest, StaleUnregisterKeepsNewerChannel) {
  presence::ConnectionRegistry registry;
  auto first = std::make_shared<RecordingChannel>();
  auto second = std::make_shared<RecordingChannel>();
  registry.Register(User("alice"), first);
  registry.Register(User("alice"), second);

  EXPECT_FALSE(registry.Unregister("alice", first.get()));
  EXPECT_TRUE(registry.IsOnline("alice"));
  EXPECT_TRUE(registry.Unregister("alice", second.get()));
  EXPECT_FALSE(registry.IsOnline("alice"));
  EXPECT_FALSE(registry.Unregister("alice"));
}

TEST(ConnectionRegistryTest, SendToClosedOrExpiredChannelFails) {
  presence::ConnectionRegistry registry;
  auto closed = std::make_shared<RecordingChannel>();
  registry.Register(User("alice"), closed);
  closed->Close("test");
  EXPECT_FALSE(registry.Send("alice", "new_message", nlohmann::json::object()));

  {
    auto temporary = std::make_shared<RecordingChannel>();
    registry.Register(User("bob"), temporary);
  }
  EXPECT_FALSE(registry.Send("bob", "new_message", nlohmann::json::object()));
  EXPECT_EQ(registry.ChannelOf("bob"), nullptr);
}

TEST(ConnectionRegistryTest, ReapDeadRemovesOnlyDeadEntries) {
  presence::ConnectionRegistry registry;
  auto live = std::make_shared<RecordingChannel>();
  auto closed = std::make_shared<RecordingChannel>();
  registry.Register(User("live"), live);
  registry.Register(User("closed"), closed);
  {
    auto gone = std::make_shared<RecordingChannel>();
    registry.Register(User("gone"), gone);
  }
  closed->Close("network");

  auto reaped = registry.ReapDead();
  std::set<std::string> reaped_set(reaped.begin(), reaped.end());
  EXPECT_EQ(reaped_set, (std::set<std::string>{"closed", "gone"}));
  EXPECT_EQ(registry.ListOnline(), (std::set<std::string>{"live"}));
  EXPECT_TRUE(registry.ReapDead().empty());
}
