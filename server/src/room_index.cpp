/*
 * 설명: 방 입장/퇴장과 접속 종료 시 멤버십 일괄 삭제를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_index_test.cpp
 */
#include "presence/room_index.hpp"

namespace presence {

void RoomIndex::Join(const std::string& user_id, const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  room_members_[room_id].insert(user_id);
  user_rooms_[user_id].insert(room_id);
}

bool RoomIndex::Leave(const std::string& user_id, const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool removed = false;
  auto room_it = room_members_.find(room_id);
  if (room_it != room_members_.end()) {
    removed = room_it->second.erase(user_id) > 0;
    if (room_it->second.empty()) {
      room_members_.erase(room_it);
    }
  }
  auto user_it = user_rooms_.find(user_id);
  if (user_it != user_rooms_.end()) {
    user_it->second.erase(room_id);
    if (user_it->second.empty()) {
      user_rooms_.erase(user_it);
    }
  }
  return removed;
}

std::set<std::string> RoomIndex::MembersOf(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = room_members_.find(room_id);
  if (it == room_members_.end()) {
    return {};
  }
  return it->second;
}

std::set<std::string> RoomIndex::RoomsOf(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = user_rooms_.find(user_id);
  if (it == user_rooms_.end()) {
    return {};
  }
  return it->second;
}

std::set<std::string> RoomIndex::DropAll(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto user_it = user_rooms_.find(user_id);
  if (user_it == user_rooms_.end()) {
    return {};
  }
  auto rooms = std::move(user_it->second);
  user_rooms_.erase(user_it);
  for (const auto& room_id : rooms) {
    auto room_it = room_members_.find(room_id);
    if (room_it == room_members_.end()) {
      continue;
    }
    room_it->second.erase(user_id);
    if (room_it->second.empty()) {
      room_members_.erase(room_it);
    }
  }
  return rooms;
}

std::size_t RoomIndex::RoomCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return room_members_.size();
}

}  // namespace presence
