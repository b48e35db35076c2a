/*
 * 설명: 오프라인 수신자별 고정 용량 FIFO 메시지 대기열.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/offline_queue_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace presence {

struct QueuedMessage {
  std::string recipient_user_id;
  nlohmann::json payload;
  std::chrono::system_clock::time_point queued_at;
};

class OfflineQueue {
 public:
  static constexpr std::size_t kDefaultCapacity = 100;

  explicit OfflineQueue(std::size_t capacity = kDefaultCapacity);

  // 용량을 넘으면 가장 오래된 메시지를 버린다. 버린 개수를 돌려준다.
  std::size_t Enqueue(const std::string& user_id, nlohmann::json payload);
  std::vector<QueuedMessage> Drain(const std::string& user_id);
  // Drain 후 전달하지 못한 메시지를 원래 순서대로 대기열 앞에 되돌린다.
  std::size_t Restore(const std::string& user_id, std::vector<QueuedMessage> messages);
  std::size_t SizeOf(const std::string& user_id) const;
  std::size_t TotalSize() const;
  std::size_t Capacity() const { return capacity_; }

 private:
  std::size_t TrimLocked(std::deque<QueuedMessage>& queue);

  std::size_t capacity_;
  std::unordered_map<std::string, std::deque<QueuedMessage>> queues_;
  mutable std::mutex mutex_;
};

}  // namespace presence
