/*
 * 설명: 구조화 로그와 프레즌스 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "presence/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "presence/api_response.hpp"

namespace presence {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
  return {{"handshakes", {{"accepted", snapshot.handshake_accepted}, {"rejected", snapshot.handshake_rejected}}},
          {"messages",
           {{"delivered", snapshot.messages_delivered},
            {"queued", snapshot.messages_queued},
            {"evicted", snapshot.queue_evictions}}},
          {"malformedEvents", snapshot.malformed_events},
          {"staleConnectionsReaped", snapshot.stale_connections_reaped},
          {"deliveryRecordsPruned", snapshot.delivery_records_pruned},
          {"websocketActive", snapshot.websocket_active},
          {"tables",
           {{"connections", snapshot.tables.connections},
            {"rooms", snapshot.tables.rooms},
            {"queuedMessages", snapshot.tables.queued_messages},
            {"typingSessions", snapshot.tables.typing_sessions},
            {"deliveryRecords", snapshot.tables.delivery_records}}}};
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementHandshake(bool accepted) {
  if (accepted) {
    handshake_accepted_.fetch_add(1);
  } else {
    handshake_rejected_.fetch_add(1);
  }
}

void Observability::AddDelivered(std::uint64_t count) { messages_delivered_.fetch_add(count); }

void Observability::AddQueued(std::uint64_t count) { messages_queued_.fetch_add(count); }

void Observability::AddEvictions(std::uint64_t count) { queue_evictions_.fetch_add(count); }

void Observability::IncrementMalformed() { malformed_events_.fetch_add(1); }

void Observability::AddReaped(std::uint64_t count) { stale_connections_reaped_.fetch_add(count); }

void Observability::AddPruned(std::uint64_t count) { delivery_records_pruned_.fetch_add(count); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot(const PresenceStats& tables) const {
  MetricsSnapshot snapshot;
  snapshot.handshake_accepted = handshake_accepted_.load();
  snapshot.handshake_rejected = handshake_rejected_.load();
  snapshot.messages_delivered = messages_delivered_.load();
  snapshot.messages_queued = messages_queued_.load();
  snapshot.queue_evictions = queue_evictions_.load();
  snapshot.malformed_events = malformed_events_.load();
  snapshot.stale_connections_reaped = stale_connections_reaped_.load();
  snapshot.delivery_records_pruned = delivery_records_pruned_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.tables = tables;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = ToIsoString(std::chrono::system_clock::now());
  log_json["level"] = LevelName(ctx.level);
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.room_id) {
    log_json["roomId"] = *ctx.room_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (ctx.level == LogLevel::kError) {
    std::cerr << line << std::endl;
    return;
  }
  std::cout << line << std::endl;
}

}  // namespace presence
