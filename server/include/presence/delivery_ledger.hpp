/*
 * 설명: (메시지, 수신자) 단위의 전달/읽음 상태를 보관하고 보존 기간이 지난 기록을 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/delivery_ledger_test.cpp, server/tests/unit/health_monitor_test.cpp
 */
#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace presence {

enum class DeliveryStatus { kDelivered, kRead };

std::string_view ToString(DeliveryStatus status);

struct DeliveryRecord {
  std::string message_id;
  std::string recipient_user_id;
  DeliveryStatus status{DeliveryStatus::kDelivered};
  std::chrono::system_clock::time_point status_at;
  std::optional<std::chrono::system_clock::time_point> read_at;
};

nlohmann::json ToJson(const DeliveryRecord& record);

class DeliveryLedger {
 public:
  void MarkDelivered(const std::string& message_id, const std::string& recipient_user_id,
                     std::chrono::system_clock::time_point now);
  // 기록이 없으면 아무것도 만들지 않고 false를 돌려준다.
  bool MarkRead(const std::string& message_id, const std::string& recipient_user_id,
                std::chrono::system_clock::time_point now);
  std::vector<DeliveryRecord> StatusesFor(const std::string& message_id) const;
  std::optional<DeliveryRecord> Find(const std::string& message_id, const std::string& recipient_user_id) const;
  std::size_t PruneOlderThan(std::chrono::seconds max_age, std::chrono::system_clock::time_point now);
  std::size_t Size() const;

 private:
  using Key = std::pair<std::string, std::string>;

  std::map<Key, DeliveryRecord> records_;
  mutable std::mutex mutex_;
};

}  // namespace presence
