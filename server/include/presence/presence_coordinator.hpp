/*
 * 설명: 수신 이벤트를 해석해 프레즌스 테이블을 갱신하고 방/사용자에게 이벤트를 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_coordinator_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/post.hpp>

#include <nlohmann/json.hpp>

#include "presence/api_response.hpp"
#include "presence/channel.hpp"
#include "presence/identity.hpp"
#include "presence/observability.hpp"
#include "presence/presence_state.hpp"

namespace presence {

struct DeliveryReceipt {
  bool success{true};
  std::string message_id;
  std::size_t delivered_to{0};
  std::size_t queued_for{0};
};

nlohmann::json ToJson(const DeliveryReceipt& receipt);

class PresenceCoordinator : public std::enable_shared_from_this<PresenceCoordinator> {
 public:
  PresenceCoordinator(const LoopExecutor& executor, std::shared_ptr<PresenceState> state,
                      std::shared_ptr<Observability> observability);
  ~PresenceCoordinator();

  PresenceCoordinator(const PresenceCoordinator&) = delete;
  PresenceCoordinator& operator=(const PresenceCoordinator&) = delete;

  // 이벤트 루프(strand)에서 실행할 작업을 넣는다. 핸들러는 서로 겹쳐 실행되지 않는다.
  void Post(std::function<void()> task) { boost::asio::post(executor_, std::move(task)); }
  const LoopExecutor& Executor() const { return executor_; }

  void Connect(const UserIdentity& user, const std::shared_ptr<Channel>& channel);
  void Disconnect(const UserIdentity& user, const Channel* channel, const std::string& reason);
  void Dispatch(const UserIdentity& user, const std::shared_ptr<Channel>& channel, const WsEnvelope& inbound);

  void JoinRoom(const UserIdentity& user, const std::string& room_id);
  void LeaveRoom(const UserIdentity& user, const std::string& room_id);
  DeliveryReceipt SendMessage(const UserIdentity& sender, const std::string& room_id, const nlohmann::json& message);
  void StartTyping(const UserIdentity& user, const std::string& room_id);
  void StopTyping(const UserIdentity& user, const std::string& room_id);
  void BroadcastReaction(const UserIdentity& user, const std::string& room_id, const std::string& message_id,
                         const std::optional<std::string>& emoji, bool added);
  void BroadcastEdit(const UserIdentity& user, const std::string& room_id, const std::string& message_id,
                     const nlohmann::json& new_text);
  void BroadcastDelete(const UserIdentity& user, const std::string& room_id, const std::string& message_id);
  void MarkRead(const UserIdentity& reader, const std::string& message_id,
                const std::optional<std::string>& sender_id, const std::optional<std::string>& room_id);
  void ConfirmDelivered(const UserIdentity& recipient, const std::string& message_id, const std::string& sender_id);
  void UpdateStatus(const UserIdentity& user, const nlohmann::json& status);

 private:
  std::size_t BroadcastToRoom(const std::string& room_id, const std::string& event, const nlohmann::json& payload,
                              const std::string& exclude_user_id);
  void DeliverQueued(const UserIdentity& user);
  void OnTypingExpired(const std::string& room_id, const std::string& user_id);
  nlohmann::json UserPayload(const std::string& user_id, const std::string& display_name) const;
  std::string DisplayNameOf(const std::string& user_id) const;
  std::string GenerateMessageId() const;
  void Reject(const std::shared_ptr<Channel>& channel, const UserIdentity& user, const WsEnvelope& inbound,
              std::string_view code, std::string_view message);

  LoopExecutor executor_;
  std::shared_ptr<PresenceState> state_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace presence
