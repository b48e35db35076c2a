/*
 * 설명: 전달 확인 기록의 생성, 읽음 전이, 조회, 만료 정리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/delivery_ledger_test.cpp
 */
#include "presence/delivery_ledger.hpp"

#include "presence/api_response.hpp"

namespace presence {

std::string_view ToString(DeliveryStatus status) {
  switch (status) {
    case DeliveryStatus::kDelivered:
      return "delivered";
    case DeliveryStatus::kRead:
      return "read";
  }
  return "delivered";
}

nlohmann::json ToJson(const DeliveryRecord& record) {
  nlohmann::json j{{"messageId", record.message_id},
                   {"userId", record.recipient_user_id},
                   {"status", ToString(record.status)},
                   {"timestamp", ToIsoString(record.status_at)}};
  if (record.read_at) {
    j["readAt"] = ToIsoString(*record.read_at);
  }
  return j;
}

void DeliveryLedger::MarkDelivered(const std::string& message_id, const std::string& recipient_user_id,
                                   std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[Key{message_id, recipient_user_id}] =
      DeliveryRecord{message_id, recipient_user_id, DeliveryStatus::kDelivered, now, std::nullopt};
}

bool DeliveryLedger::MarkRead(const std::string& message_id, const std::string& recipient_user_id,
                              std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(Key{message_id, recipient_user_id});
  if (it == records_.end()) {
    return false;
  }
  it->second.status = DeliveryStatus::kRead;
  it->second.status_at = now;
  it->second.read_at = now;
  return true;
}

std::vector<DeliveryRecord> DeliveryLedger::StatusesFor(const std::string& message_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DeliveryRecord> result;
  for (auto it = records_.lower_bound(Key{message_id, std::string{}});
       it != records_.end() && it->first.first == message_id; ++it) {
    result.push_back(it->second);
  }
  return result;
}

std::optional<DeliveryRecord> DeliveryLedger::Find(const std::string& message_id,
                                                   const std::string& recipient_user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(Key{message_id, recipient_user_id});
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t DeliveryLedger::PruneOlderThan(std::chrono::seconds max_age, std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto cutoff = now - max_age;
  std::size_t removed = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second.status_at < cutoff) {
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t DeliveryLedger::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

}  // namespace presence
