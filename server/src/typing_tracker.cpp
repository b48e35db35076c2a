/*
 * 설명: 입력 표시 상태 머신(Idle -> Typing -> Idle)과 디바운스 재시작을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/typing_tracker_test.cpp
 */
#include "presence/typing_tracker.hpp"

namespace presence {

TypingTracker::TypingTracker(const LoopExecutor& executor, std::chrono::milliseconds debounce)
    : executor_(executor), debounce_(debounce.count() > 0 ? debounce : kDefaultDebounce) {}

void TypingTracker::SetExpiryCallback(ExpiryCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_expired_ = std::move(callback);
}

bool TypingTracker::Start(const std::string& room_id, const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto key = Key{room_id, user_id};
  auto it = sessions_.find(key);
  if (it != sessions_.end()) {
    it->second.expires_at = std::chrono::steady_clock::now() + debounce_;
    it->second.timer->Reset(debounce_);
    return false;
  }
  TypingSession session{room_id, user_id, std::chrono::steady_clock::now() + debounce_,
                        std::make_unique<CancellableTimer>(executor_)};
  session.timer->Start(debounce_, [this, room_id, user_id]() { Expire(room_id, user_id); });
  sessions_.emplace(std::move(key), std::move(session));
  return true;
}

bool TypingTracker::Stop(const std::string& room_id, const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(Key{room_id, user_id});
  if (it == sessions_.end()) {
    return false;
  }
  it->second.timer->Cancel();
  sessions_.erase(it);
  return true;
}

std::vector<std::string> TypingTracker::StopAll(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> rooms;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->first.second != user_id) {
      ++it;
      continue;
    }
    it->second.timer->Cancel();
    rooms.push_back(it->first.first);
    it = sessions_.erase(it);
  }
  return rooms;
}

bool TypingTracker::IsTyping(const std::string& room_id, const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(Key{room_id, user_id}) > 0;
}

std::set<std::string> TypingTracker::TypingIn(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> users;
  for (auto it = sessions_.lower_bound(Key{room_id, std::string{}});
       it != sessions_.end() && it->first.first == room_id; ++it) {
    users.insert(it->first.second);
  }
  return users;
}

std::size_t TypingTracker::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void TypingTracker::Expire(const std::string& room_id, const std::string& user_id) {
  ExpiryCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(Key{room_id, user_id});
    if (it == sessions_.end()) {
      return;
    }
    sessions_.erase(it);
    callback = on_expired_;
  }
  if (callback) {
    callback(room_id, user_id);
  }
}

}  // namespace presence
