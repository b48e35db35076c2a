/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace presence {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string jwt_secret;
  std::string identity_lookup;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t offline_queue_capacity;
  std::size_t typing_debounce_ms;
  std::size_t liveness_sweep_seconds;
  std::size_t delivery_prune_seconds;
  std::size_t delivery_retention_seconds;
};

AppConfig LoadConfigFromEnv();

}  // namespace presence
