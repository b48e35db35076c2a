/*
 * 설명: 구조화 로그와 프레즌스 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/health_monitor_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace presence {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::string> room_id;
  std::string name;
  long latency_ms{0};
  nlohmann::json detail;
};

// 각 테이블 크기. PresenceState::Stats()가 채운다.
struct PresenceStats {
  std::uint64_t connections{0};
  std::uint64_t rooms{0};
  std::uint64_t queued_messages{0};
  std::uint64_t typing_sessions{0};
  std::uint64_t delivery_records{0};
};

struct MetricsSnapshot {
  std::uint64_t handshake_accepted{0};
  std::uint64_t handshake_rejected{0};
  std::uint64_t messages_delivered{0};
  std::uint64_t messages_queued{0};
  std::uint64_t queue_evictions{0};
  std::uint64_t malformed_events{0};
  std::uint64_t stale_connections_reaped{0};
  std::uint64_t delivery_records_pruned{0};
  std::uint64_t websocket_active{0};
  PresenceStats tables;
};

nlohmann::json ToJson(const MetricsSnapshot& snapshot);

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementHandshake(bool accepted);
  void AddDelivered(std::uint64_t count);
  void AddQueued(std::uint64_t count);
  void AddEvictions(std::uint64_t count);
  void IncrementMalformed();
  void AddReaped(std::uint64_t count);
  void AddPruned(std::uint64_t count);
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(const PresenceStats& tables) const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> handshake_accepted_{0};
  std::atomic<std::uint64_t> handshake_rejected_{0};
  std::atomic<std::uint64_t> messages_delivered_{0};
  std::atomic<std::uint64_t> messages_queued_{0};
  std::atomic<std::uint64_t> queue_evictions_{0};
  std::atomic<std::uint64_t> malformed_events_{0};
  std::atomic<std::uint64_t> stale_connections_reaped_{0};
  std::atomic<std::uint64_t> delivery_records_pruned_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace presence
