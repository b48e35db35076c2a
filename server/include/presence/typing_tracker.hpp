/*
 * 설명: 방별 입력 중 사용자 집합과 (방, 사용자)별 자동 만료 타이머를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/typing_tracker_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "presence/cancellable_timer.hpp"

namespace presence {

class TypingTracker {
 public:
  using ExpiryCallback = std::function<void(const std::string& room_id, const std::string& user_id)>;

  static constexpr std::chrono::milliseconds kDefaultDebounce{3000};

  TypingTracker(const LoopExecutor& executor, std::chrono::milliseconds debounce);

  void SetExpiryCallback(ExpiryCallback callback);

  // Idle -> Typing이면 true, 이미 입력 중이어서 타이머만 다시 건 경우 false.
  bool Start(const std::string& room_id, const std::string& user_id);
  bool Stop(const std::string& room_id, const std::string& user_id);
  std::vector<std::string> StopAll(const std::string& user_id);
  bool IsTyping(const std::string& room_id, const std::string& user_id) const;
  std::set<std::string> TypingIn(const std::string& room_id) const;
  std::size_t ActiveCount() const;
  std::chrono::milliseconds Debounce() const { return debounce_; }

 private:
  using Key = std::pair<std::string, std::string>;

  struct TypingSession {
    std::string room_id;
    std::string user_id;
    std::chrono::steady_clock::time_point expires_at;
    std::unique_ptr<CancellableTimer> timer;
  };

  void Expire(const std::string& room_id, const std::string& user_id);

  LoopExecutor executor_;
  std::chrono::milliseconds debounce_;
  std::map<Key, TypingSession> sessions_;
  ExpiryCallback on_expired_;
  mutable std::mutex mutex_;
};

}  // namespace presence
