/*
 * 설명: 사용자별 활성 채널을 관리하며 온라인 여부의 유일한 기준이 된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "presence/channel.hpp"
#include "presence/identity.hpp"
#include "presence/observability.hpp"

namespace presence {

struct Connection {
  UserIdentity user;
  std::weak_ptr<Channel> channel;
  const Channel* raw{nullptr};
  std::chrono::system_clock::time_point connected_at;
};

class ConnectionRegistry {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  // 기존 연결을 대체한다. 대체된 채널을 돌려주며 닫는 것은 호출자의 몫이다.
  std::shared_ptr<Channel> Register(const UserIdentity& user, const std::shared_ptr<Channel>& channel);
  bool Unregister(const std::string& user_id);
  bool Unregister(const std::string& user_id, const Channel* channel);
  bool IsOnline(const std::string& user_id) const;
  bool Send(const std::string& user_id, const std::string& event, const nlohmann::json& payload);
  std::set<std::string> ListOnline() const;
  std::optional<Connection> Find(const std::string& user_id) const;
  std::shared_ptr<Channel> ChannelOf(const std::string& user_id) const;
  std::vector<std::string> ReapDead();
  std::size_t Size() const;

 private:
  void PublishGauge();

  std::unordered_map<std::string, Connection> connections_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace presence
