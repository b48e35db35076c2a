/*
 * 설명: 접속/종료, 방 멤버십, 메시지 전달과 오프라인 적재, 입력 표시, 읽음 확인 이벤트를 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_coordinator_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#include "presence/presence_coordinator.hpp"

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace presence {
namespace {
std::optional<std::string> StringField(const nlohmann::json& payload, const char* key) {
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

// join_room/leave_room은 roomId 문자열만 보내는 클라이언트도 허용한다.
std::optional<std::string> RoomIdOf(const nlohmann::json& payload) {
  if (payload.is_string() && !payload.get<std::string>().empty()) {
    return payload.get<std::string>();
  }
  return StringField(payload, "roomId");
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  std::ostringstream oss;
  for (unsigned char byte : buffer) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}

std::string NowIso() { return ToIsoString(std::chrono::system_clock::now()); }
}  // namespace

nlohmann::json ToJson(const DeliveryReceipt& receipt) {
  return {{"success", receipt.success},
          {"messageId", receipt.message_id},
          {"deliveredTo", receipt.delivered_to},
          {"queuedFor", receipt.queued_for}};
}

PresenceCoordinator::PresenceCoordinator(const LoopExecutor& executor, std::shared_ptr<PresenceState> state,
                                         std::shared_ptr<Observability> observability)
    : executor_(executor), state_(std::move(state)),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>()) {
  state_->typing.SetExpiryCallback(
      [this](const std::string& room_id, const std::string& user_id) { OnTypingExpired(room_id, user_id); });
}

PresenceCoordinator::~PresenceCoordinator() { state_->typing.SetExpiryCallback(nullptr); }

void PresenceCoordinator::Connect(const UserIdentity& user, const std::shared_ptr<Channel>& channel) {
  auto previous = state_->connections.Register(user, channel);
  if (previous) {
    previous->Close("replaced");
  }
  channel->Send(MakeEventEnvelope("auth_state", {{"userId", user.user_id},
                                                 {"displayName", user.display_name},
                                                 {"queued", state_->offline_queue.SizeOf(user.user_id)}}));
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .user_id = user.user_id,
                                 .name = "connection.open",
                                 .detail = {{"replaced", previous != nullptr}}});
  DeliverQueued(user);
}

void PresenceCoordinator::Disconnect(const UserIdentity& user, const Channel* channel, const std::string& reason) {
  auto connection = state_->connections.Find(user.user_id);
  if (connection && connection->raw != channel) {
    // 새 세션이 이미 등록을 대체했다. 이전 세션의 종료는 상태를 건드리지 않는다.
    observability_->Log(
        LogContext{.level = LogLevel::kDebug, .user_id = user.user_id, .name = "connection.close_stale"});
    return;
  }

  const auto user_payload = UserPayload(user.user_id, user.display_name);
  for (const auto& room_id : state_->typing.StopAll(user.user_id)) {
    auto payload = user_payload;
    payload["roomId"] = room_id;
    BroadcastToRoom(room_id, "typing_stop", payload, user.user_id);
  }
  for (const auto& room_id : state_->rooms.RoomsOf(user.user_id)) {
    auto payload = user_payload;
    payload["roomId"] = room_id;
    BroadcastToRoom(room_id, "user_offline", payload, user.user_id);
  }
  state_->rooms.DropAll(user.user_id);
  state_->connections.Unregister(user.user_id, channel);
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .user_id = user.user_id,
                                 .name = "connection.close",
                                 .detail = {{"reason", reason}}});
}

void PresenceCoordinator::Dispatch(const UserIdentity& user, const std::shared_ptr<Channel>& channel,
                                   const WsEnvelope& inbound) {
  const auto& event = inbound.event;
  const auto& p = inbound.payload;
  try {
    if (event == "ping") {
      channel->Send(MakeAckEnvelope("ping", inbound.seq, {{"reply", "pong"}, {"timestamp", NowIso()}}));
      return;
    }
    if (event == "join_room" || event == "leave_room") {
      auto room_id = RoomIdOf(p);
      if (!room_id) {
        return Reject(channel, user, inbound, "bad_request", "roomId가 필요합니다");
      }
      if (event == "join_room") {
        JoinRoom(user, *room_id);
      } else {
        LeaveRoom(user, *room_id);
      }
      return;
    }
    if (event == "send_message") {
      auto room_id = StringField(p, "roomId");
      if (!room_id || !p.contains("message") || !p["message"].is_object()) {
        return Reject(channel, user, inbound, "bad_request", "roomId와 message 객체가 필요합니다");
      }
      auto receipt = SendMessage(user, *room_id, p["message"]);
      channel->Send(MakeAckEnvelope("send_message", inbound.seq, ToJson(receipt)));
      return;
    }
    if (event == "typing_start" || event == "typing_stop") {
      auto room_id = RoomIdOf(p);
      if (!room_id) {
        return Reject(channel, user, inbound, "bad_request", "roomId가 필요합니다");
      }
      if (event == "typing_start") {
        StartTyping(user, *room_id);
      } else {
        StopTyping(user, *room_id);
      }
      return;
    }
    if (event == "add_reaction" || event == "remove_reaction") {
      auto room_id = StringField(p, "roomId");
      auto message_id = StringField(p, "messageId");
      auto emoji = StringField(p, "emoji");
      const bool added = event == "add_reaction";
      if (!room_id || !message_id || (added && !emoji)) {
        return Reject(channel, user, inbound, "bad_request", "roomId, messageId, emoji가 필요합니다");
      }
      BroadcastReaction(user, *room_id, *message_id, emoji, added);
      return;
    }
    if (event == "edit_message") {
      auto room_id = StringField(p, "roomId");
      auto message_id = StringField(p, "messageId");
      if (!room_id || !message_id || !p.contains("newText") || !p["newText"].is_string()) {
        return Reject(channel, user, inbound, "bad_request", "roomId, messageId, newText가 필요합니다");
      }
      BroadcastEdit(user, *room_id, *message_id, p["newText"]);
      return;
    }
    if (event == "delete_message") {
      auto room_id = StringField(p, "roomId");
      auto message_id = StringField(p, "messageId");
      if (!room_id || !message_id) {
        return Reject(channel, user, inbound, "bad_request", "roomId와 messageId가 필요합니다");
      }
      BroadcastDelete(user, *room_id, *message_id);
      return;
    }
    if (event == "mark_read") {
      auto message_id = StringField(p, "messageId");
      if (!message_id) {
        return Reject(channel, user, inbound, "bad_request", "messageId가 필요합니다");
      }
      MarkRead(user, *message_id, StringField(p, "senderId"), StringField(p, "roomId"));
      return;
    }
    if (event == "message_delivered") {
      auto message_id = StringField(p, "messageId");
      auto sender_id = StringField(p, "senderId");
      if (!message_id || !sender_id) {
        return Reject(channel, user, inbound, "bad_request", "messageId와 senderId가 필요합니다");
      }
      ConfirmDelivered(user, *message_id, *sender_id);
      return;
    }
    if (event == "delivery_status") {
      auto message_id = StringField(p, "messageId");
      if (!message_id) {
        return Reject(channel, user, inbound, "bad_request", "messageId가 필요합니다");
      }
      auto recipients = nlohmann::json::array();
      for (const auto& record : state_->ledger.StatusesFor(*message_id)) {
        recipients.push_back(ToJson(record));
      }
      channel->Send(MakeAckEnvelope("delivery_status", inbound.seq,
                                    {{"messageId", *message_id}, {"recipients", recipients}}));
      return;
    }
    if (event == "status_update") {
      nlohmann::json status;
      if (p.is_string() && !p.get<std::string>().empty()) {
        status = p;
      } else if (p.is_object() && p.contains("status") && !p["status"].is_null()) {
        status = p["status"];
      } else {
        return Reject(channel, user, inbound, "bad_request", "status가 필요합니다");
      }
      UpdateStatus(user, status);
      return;
    }
    Reject(channel, user, inbound, "unknown_event", "알 수 없는 이벤트");
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{.level = LogLevel::kError,
                                   .user_id = user.user_id,
                                   .name = "event.failed",
                                   .detail = {{"event", event}, {"error", ex.what()}}});
    channel->Send(MakeWsErrorEnvelope("internal_error", "이벤트 처리에 실패했습니다", inbound.seq));
  }
}

void PresenceCoordinator::JoinRoom(const UserIdentity& user, const std::string& room_id) {
  state_->rooms.Join(user.user_id, room_id);
  // 이미 참여 중이어도 입장 알림은 다시 보낸다.
  auto payload = UserPayload(user.user_id, user.display_name);
  payload["roomId"] = room_id;
  BroadcastToRoom(room_id, "user_joined", payload, user.user_id);
  observability_->Log(
      LogContext{.level = LogLevel::kInfo, .user_id = user.user_id, .room_id = room_id, .name = "room.join"});
}

void PresenceCoordinator::LeaveRoom(const UserIdentity& user, const std::string& room_id) {
  state_->rooms.Leave(user.user_id, room_id);
  auto payload = UserPayload(user.user_id, user.display_name);
  payload["roomId"] = room_id;
  if (state_->typing.Stop(room_id, user.user_id)) {
    BroadcastToRoom(room_id, "typing_stop", payload, user.user_id);
  }
  BroadcastToRoom(room_id, "user_left", payload, user.user_id);
  observability_->Log(
      LogContext{.level = LogLevel::kInfo, .user_id = user.user_id, .room_id = room_id, .name = "room.leave"});
}

DeliveryReceipt PresenceCoordinator::SendMessage(const UserIdentity& sender, const std::string& room_id,
                                                 const nlohmann::json& message) {
  const auto started = std::chrono::steady_clock::now();
  const auto now = std::chrono::system_clock::now();
  DeliveryReceipt receipt;
  if (auto id = StringField(message, "_id")) {
    receipt.message_id = *id;
  } else if (auto message_id = StringField(message, "messageId")) {
    receipt.message_id = *message_id;
  } else {
    receipt.message_id = GenerateMessageId();
  }

  nlohmann::json data = message;
  data["messageId"] = receipt.message_id;
  data["roomId"] = room_id;
  data["sender"] = UserPayload(sender.user_id, sender.display_name);
  data["timestamp"] = ToIsoString(now);
  data["deliveryStatus"] = "sent";

  std::size_t evicted = 0;
  for (const auto& member : state_->rooms.MembersOf(room_id)) {
    if (member == sender.user_id) {
      continue;
    }
    // 온라인으로 보이지만 전송에 실패하면 오프라인과 똑같이 적재한다.
    if (state_->connections.IsOnline(member) && state_->connections.Send(member, "new_message", data)) {
      state_->ledger.MarkDelivered(receipt.message_id, member, now);
      ++receipt.delivered_to;
      continue;
    }
    evicted += state_->offline_queue.Enqueue(member, data);
    ++receipt.queued_for;
  }

  observability_->AddDelivered(receipt.delivered_to);
  observability_->AddQueued(receipt.queued_for);
  if (evicted > 0) {
    observability_->AddEvictions(evicted);
    observability_->Log(LogContext{.level = LogLevel::kWarn,
                                   .user_id = sender.user_id,
                                   .room_id = room_id,
                                   .name = "queue.evicted",
                                   .detail = {{"count", evicted}}});
  }
  auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .user_id = sender.user_id,
                                 .room_id = room_id,
                                 .name = "message.send",
                                 .latency_ms = static_cast<long>(latency.count()),
                                 .detail = {{"messageId", receipt.message_id},
                                            {"deliveredTo", receipt.delivered_to},
                                            {"queuedFor", receipt.queued_for}}});
  return receipt;
}

void PresenceCoordinator::StartTyping(const UserIdentity& user, const std::string& room_id) {
  state_->typing.Start(room_id, user.user_id);
  auto payload = UserPayload(user.user_id, user.display_name);
  payload["roomId"] = room_id;
  BroadcastToRoom(room_id, "typing_start", payload, user.user_id);
}

void PresenceCoordinator::StopTyping(const UserIdentity& user, const std::string& room_id) {
  if (!state_->typing.Stop(room_id, user.user_id)) {
    return;
  }
  auto payload = UserPayload(user.user_id, user.display_name);
  payload["roomId"] = room_id;
  BroadcastToRoom(room_id, "typing_stop", payload, user.user_id);
}

void PresenceCoordinator::BroadcastReaction(const UserIdentity& user, const std::string& room_id,
                                            const std::string& message_id, const std::optional<std::string>& emoji,
                                            bool added) {
  auto payload = UserPayload(user.user_id, user.display_name);
  payload["roomId"] = room_id;
  payload["messageId"] = message_id;
  if (emoji) {
    payload["emoji"] = *emoji;
  }
  BroadcastToRoom(room_id, added ? "reaction_added" : "reaction_removed", payload, user.user_id);
}

void PresenceCoordinator::BroadcastEdit(const UserIdentity& user, const std::string& room_id,
                                        const std::string& message_id, const nlohmann::json& new_text) {
  nlohmann::json payload{{"roomId", room_id},
                         {"messageId", message_id},
                         {"newText", new_text},
                         {"editedBy", user.user_id},
                         {"editedByName", user.display_name},
                         {"editedAt", NowIso()}};
  BroadcastToRoom(room_id, "message_edited", payload, user.user_id);
}

void PresenceCoordinator::BroadcastDelete(const UserIdentity& user, const std::string& room_id,
                                          const std::string& message_id) {
  nlohmann::json payload{{"roomId", room_id},
                         {"messageId", message_id},
                         {"deletedBy", user.user_id},
                         {"deletedByName", user.display_name},
                         {"deletedAt", NowIso()}};
  BroadcastToRoom(room_id, "message_deleted", payload, user.user_id);
}

void PresenceCoordinator::MarkRead(const UserIdentity& reader, const std::string& message_id,
                                   const std::optional<std::string>& sender_id,
                                   const std::optional<std::string>& room_id) {
  const auto now = std::chrono::system_clock::now();
  const bool recorded = state_->ledger.MarkRead(message_id, reader.user_id, now);
  auto payload = UserPayload(reader.user_id, reader.display_name);
  payload["messageId"] = message_id;
  payload["timestamp"] = ToIsoString(now);

  bool sender_notified = false;
  if (room_id) {
    payload["roomId"] = *room_id;
    sender_notified = sender_id && state_->rooms.MembersOf(*room_id).count(*sender_id) > 0;
    BroadcastToRoom(*room_id, "message_read", payload, reader.user_id);
  }
  if (sender_id && !sender_notified && *sender_id != reader.user_id) {
    state_->connections.Send(*sender_id, "message_read", payload);
  }
  observability_->Log(LogContext{.level = LogLevel::kDebug,
                                 .user_id = reader.user_id,
                                 .name = "message.read",
                                 .detail = {{"messageId", message_id}, {"recorded", recorded}}});
}

void PresenceCoordinator::ConfirmDelivered(const UserIdentity& recipient, const std::string& message_id,
                                           const std::string& sender_id) {
  if (!state_->connections.IsOnline(sender_id)) {
    return;
  }
  state_->connections.Send(sender_id, "message_delivery_confirmed",
                           {{"messageId", message_id},
                            {"confirmedBy", recipient.user_id},
                            {"confirmedByName", recipient.display_name},
                            {"timestamp", NowIso()}});
}

void PresenceCoordinator::UpdateStatus(const UserIdentity& user, const nlohmann::json& status) {
  auto payload = UserPayload(user.user_id, user.display_name);
  payload["status"] = status;
  for (const auto& room_id : state_->rooms.RoomsOf(user.user_id)) {
    payload["roomId"] = room_id;
    BroadcastToRoom(room_id, "status_update", payload, user.user_id);
  }
}

std::size_t PresenceCoordinator::BroadcastToRoom(const std::string& room_id, const std::string& event,
                                                 const nlohmann::json& payload, const std::string& exclude_user_id) {
  std::size_t sent = 0;
  for (const auto& member : state_->rooms.MembersOf(room_id)) {
    if (member == exclude_user_id) {
      continue;
    }
    if (state_->connections.Send(member, event, payload)) {
      ++sent;
    }
  }
  return sent;
}

void PresenceCoordinator::DeliverQueued(const UserIdentity& user) {
  auto queued = state_->offline_queue.Drain(user.user_id);
  if (queued.empty()) {
    return;
  }
  const auto now = std::chrono::system_clock::now();
  std::size_t delivered = 0;
  for (; delivered < queued.size(); ++delivered) {
    const auto& item = queued[delivered];
    auto payload = item.payload;
    payload["deliveryStatus"] = "delivered_from_queue";
    payload["queuedAt"] = ToIsoString(item.queued_at);
    if (!state_->connections.Send(user.user_id, "new_message", payload)) {
      break;
    }
    if (auto message_id = StringField(payload, "messageId")) {
      state_->ledger.MarkDelivered(*message_id, user.user_id, now);
    }
  }
  observability_->AddDelivered(delivered);
  if (delivered < queued.size()) {
    const auto remaining = queued.size() - delivered;
    std::vector<QueuedMessage> rest(std::make_move_iterator(queued.begin() + static_cast<std::ptrdiff_t>(delivered)),
                                    std::make_move_iterator(queued.end()));
    observability_->AddEvictions(state_->offline_queue.Restore(user.user_id, std::move(rest)));
    observability_->Log(LogContext{.level = LogLevel::kWarn,
                                   .user_id = user.user_id,
                                   .name = "queue.redeliver_failed",
                                   .detail = {{"delivered", delivered}, {"restored", remaining}}});
    return;
  }
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .user_id = user.user_id,
                                 .name = "queue.drained",
                                 .detail = {{"delivered", delivered}}});
}

void PresenceCoordinator::OnTypingExpired(const std::string& room_id, const std::string& user_id) {
  auto payload = UserPayload(user_id, DisplayNameOf(user_id));
  payload["roomId"] = room_id;
  BroadcastToRoom(room_id, "typing_stop", payload, user_id);
}

nlohmann::json PresenceCoordinator::UserPayload(const std::string& user_id, const std::string& display_name) const {
  return {{"userId", user_id}, {"userName", display_name}, {"timestamp", NowIso()}};
}

std::string PresenceCoordinator::DisplayNameOf(const std::string& user_id) const {
  auto connection = state_->connections.Find(user_id);
  return connection ? connection->user.display_name : user_id;
}

std::string PresenceCoordinator::GenerateMessageId() const {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return "msg_" + std::to_string(ms) + "_" + RandomHex(5);
}

void PresenceCoordinator::Reject(const std::shared_ptr<Channel>& channel, const UserIdentity& user,
                                 const WsEnvelope& inbound, std::string_view code, std::string_view message) {
  observability_->IncrementMalformed();
  observability_->Log(LogContext{.level = LogLevel::kWarn,
                                 .user_id = user.user_id,
                                 .name = "event.rejected",
                                 .detail = {{"event", inbound.event}, {"code", code}}});
  channel->Send(MakeWsErrorEnvelope(code, message, inbound.seq));
}

}  // namespace presence
