/*
 * 설명: 접속한 사용자 한 명의 양방향 이벤트 채널 추상화.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <string>

#include "presence/api_response.hpp"

namespace presence {

class Channel {
 public:
  virtual ~Channel() = default;

  // 전송 대기열에 넣지 못하면 false. 예외를 던지지 않는다.
  virtual bool Send(const WsEnvelope& envelope) = 0;
  virtual bool IsOpen() const = 0;
  virtual void Close(const std::string& reason) = 0;
};

}  // namespace presence
