/*
 * 설명: 사용자와 채팅방 사이의 양방향 멤버십 색인.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_index_test.cpp
 */
#pragma once

#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

namespace presence {

class RoomIndex {
 public:
  void Join(const std::string& user_id, const std::string& room_id);
  bool Leave(const std::string& user_id, const std::string& room_id);
  std::set<std::string> MembersOf(const std::string& room_id) const;
  std::set<std::string> RoomsOf(const std::string& user_id) const;
  std::set<std::string> DropAll(const std::string& user_id);
  std::size_t RoomCount() const;

 private:
  std::unordered_map<std::string, std::set<std::string>> room_members_;
  std::unordered_map<std::string, std::set<std::string>> user_rooms_;
  mutable std::mutex mutex_;
};

}  // namespace presence
