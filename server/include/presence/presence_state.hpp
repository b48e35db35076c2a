/*
 * 설명: 프로세스당 한 번 생성되어 코디네이터와 헬스 모니터에 주입되는 다섯 개의 프레즌스 테이블 묶음.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_coordinator_test.cpp, server/tests/unit/health_monitor_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>

#include "presence/cancellable_timer.hpp"
#include "presence/connection_registry.hpp"
#include "presence/delivery_ledger.hpp"
#include "presence/observability.hpp"
#include "presence/offline_queue.hpp"
#include "presence/room_index.hpp"
#include "presence/typing_tracker.hpp"

namespace presence {

struct PresenceLimits {
  std::size_t offline_queue_capacity{OfflineQueue::kDefaultCapacity};
  std::chrono::milliseconds typing_debounce{TypingTracker::kDefaultDebounce};
};

struct PresenceState {
  PresenceState(const LoopExecutor& executor, const PresenceLimits& limits)
      : typing(executor, limits.typing_debounce), offline_queue(limits.offline_queue_capacity) {}

  PresenceStats Stats() const {
    PresenceStats stats;
    stats.connections = connections.Size();
    stats.rooms = rooms.RoomCount();
    stats.queued_messages = offline_queue.TotalSize();
    stats.typing_sessions = typing.ActiveCount();
    stats.delivery_records = ledger.Size();
    return stats;
  }

  ConnectionRegistry connections;
  RoomIndex rooms;
  TypingTracker typing;
  OfflineQueue offline_queue;
  DeliveryLedger ledger;
};

}  // namespace presence
