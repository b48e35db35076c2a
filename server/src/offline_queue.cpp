/*
 * 설명: 오프라인 메시지 적재, 초과분 축출, 재접속 시 일괄 배출을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/offline_queue_test.cpp
 */
#include "presence/offline_queue.hpp"

#include <iterator>

namespace presence {

OfflineQueue::OfflineQueue(std::size_t capacity) : capacity_(capacity == 0 ? kDefaultCapacity : capacity) {}

std::size_t OfflineQueue::Enqueue(const std::string& user_id, nlohmann::json payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& queue = queues_[user_id];
  queue.push_back(QueuedMessage{user_id, std::move(payload), std::chrono::system_clock::now()});
  return TrimLocked(queue);
}

std::vector<QueuedMessage> OfflineQueue::Drain(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = queues_.find(user_id);
  if (it == queues_.end()) {
    return {};
  }
  std::vector<QueuedMessage> drained(std::make_move_iterator(it->second.begin()),
                                     std::make_move_iterator(it->second.end()));
  queues_.erase(it);
  return drained;
}

std::size_t OfflineQueue::Restore(const std::string& user_id, std::vector<QueuedMessage> messages) {
  if (messages.empty()) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto& queue = queues_[user_id];
  queue.insert(queue.begin(), std::make_move_iterator(messages.begin()), std::make_move_iterator(messages.end()));
  return TrimLocked(queue);
}

std::size_t OfflineQueue::SizeOf(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = queues_.find(user_id);
  return it == queues_.end() ? 0 : it->second.size();
}

std::size_t OfflineQueue::TotalSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto& [user_id, queue] : queues_) {
    total += queue.size();
  }
  return total;
}

std::size_t OfflineQueue::TrimLocked(std::deque<QueuedMessage>& queue) {
  std::size_t evicted = 0;
  while (queue.size() > capacity_) {
    queue.pop_front();
    ++evicted;
  }
  return evicted;
}

}  // namespace presence
