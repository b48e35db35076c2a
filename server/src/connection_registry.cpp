/*
 * 설명: 사용자별 채널 등록/해제와 이벤트 전달, 끊긴 채널 정리를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "presence/connection_registry.hpp"

namespace presence {

std::shared_ptr<Channel> ConnectionRegistry::Register(const UserIdentity& user, const std::shared_ptr<Channel>& channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::shared_ptr<Channel> previous;
  auto it = connections_.find(user.user_id);
  if (it != connections_.end() && it->second.raw != channel.get()) {
    previous = it->second.channel.lock();
  }
  connections_[user.user_id] = Connection{user, channel, channel.get(), std::chrono::system_clock::now()};
  PublishGauge();
  return previous;
}

bool ConnectionRegistry::Unregister(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connections_.erase(user_id) == 0) {
    return false;
  }
  PublishGauge();
  return true;
}

bool ConnectionRegistry::Unregister(const std::string& user_id, const Channel* channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(user_id);
  if (it == connections_.end() || it->second.raw != channel) {
    return false;
  }
  connections_.erase(it);
  PublishGauge();
  return true;
}

bool ConnectionRegistry::IsOnline(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.count(user_id) > 0;
}

bool ConnectionRegistry::Send(const std::string& user_id, const std::string& event, const nlohmann::json& payload) {
  auto channel = ChannelOf(user_id);
  if (!channel || !channel->IsOpen()) {
    return false;
  }
  return channel->Send(MakeEventEnvelope(event, payload));
}

std::set<std::string> ConnectionRegistry::ListOnline() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> online;
  for (const auto& [user_id, connection] : connections_) {
    online.insert(user_id);
  }
  return online;
}

std::optional<Connection> ConnectionRegistry::Find(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(user_id);
  if (it == connections_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::shared_ptr<Channel> ConnectionRegistry::ChannelOf(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(user_id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second.channel.lock();
}

std::vector<std::string> ConnectionRegistry::ReapDead() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> reaped;
  for (auto it = connections_.begin(); it != connections_.end();) {
    auto channel = it->second.channel.lock();
    if (channel && channel->IsOpen()) {
      ++it;
      continue;
    }
    reaped.push_back(it->first);
    it = connections_.erase(it);
  }
  if (!reaped.empty()) {
    PublishGauge();
  }
  return reaped;
}

std::size_t ConnectionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

void ConnectionRegistry::PublishGauge() {
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

}  // namespace presence
