#include <chrono>

#include <gtest/gtest.h>

#include "presence/delivery_ledger.hpp"

using namespace std::chrono_literals;

TEST(DeliveryLedgerTest, MarkReadWithoutRecordIsNoop) {
  presence::DeliveryLedger ledger;
  EXPECT_FALSE(ledger.MarkRead("m1", "bob", std::chrono::system_clock::now()));
  EXPECT_EQ(ledger.Size(), 0u);
  EXPECT_FALSE(ledger.Find("m1", "bob").has_value());
}

TEST(DeliveryLedgerTest, DeliveredThenRead) {
  presence::DeliveryLedger ledger;
  auto t0 = std::chrono::system_clock::now();
  ledger.MarkDelivered("m1", "bob", t0);
  auto record = ledger.Find("m1", "bob");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, presence::DeliveryStatus::kDelivered);
  EXPECT_FALSE(record->read_at.has_value());

  EXPECT_TRUE(ledger.MarkRead("m1", "bob", t0 + 5s));
  record = ledger.Find("m1", "bob");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, presence::DeliveryStatus::kRead);
  EXPECT_EQ(record->status_at, t0 + 5s);
  ASSERT_TRUE(record->read_at.has_value());

  auto json = presence::ToJson(*record);
  EXPECT_EQ(json["status"], "read");
  EXPECT_EQ(json["userId"], "bob");
  EXPECT_TRUE(json.contains("readAt"));
}

TEST(DeliveryLedgerTest, StatusesForListsEveryRecipient) {
  presence::DeliveryLedger ledger;
  auto now = std::chrono::system_clock::now();
  ledger.MarkDelivered("m1", "bob", now);
  ledger.MarkDelivered("m1", "carol", now);
  ledger.MarkDelivered("m10", "bob", now);
  ledger.MarkDelivered("m0", "bob", now);

  auto statuses = ledger.StatusesFor("m1");
  ASSERT_EQ(statuses.size(), 2u);
  EXPECT_EQ(statuses[0].recipient_user_id, "bob");
  EXPECT_EQ(statuses[1].recipient_user_id, "carol");
  EXPECT_TRUE(ledger.StatusesFor("unknown").empty());
}

TEST(DeliveryLedgerTest, PruneRemovesOnlyRecordsOlderThanRetention) {
  presence::DeliveryLedger ledger;
  auto now = std::chrono::system_clock::now();
  ledger.MarkDelivered("old", "bob", now - 2h);
  ledger.MarkDelivered("fresh", "bob", now - 10min);

  EXPECT_EQ(ledger.PruneOlderThan(1h, now), 1u);
  EXPECT_FALSE(ledger.Find("old", "bob").has_value());
  EXPECT_TRUE(ledger.Find("fresh", "bob").has_value());
  EXPECT_EQ(ledger.PruneOlderThan(1h, now), 0u);
}

TEST(DeliveryLedgerTest, ReadRefreshesRetentionClock) {
  presence::DeliveryLedger ledger;
  auto now = std::chrono::system_clock::now();
  ledger.MarkDelivered("m1", "bob", now - 2h);
  ledger.MarkRead("m1", "bob", now - 1min);
  EXPECT_EQ(ledger.PruneOlderThan(1h, now), 0u);
}
