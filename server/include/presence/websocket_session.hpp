/*
 * 설명: WebSocket 연결 하나를 Channel로 감싸 수신 프레임을 코디네이터로 넘기고 송신 백프레셔를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/websocket_session_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "presence/api_response.hpp"
#include "presence/channel.hpp"
#include "presence/identity.hpp"
#include "presence/presence_coordinator.hpp"

namespace presence {

class WebSocketSession : public Channel, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, const UserIdentity& user,
                   std::shared_ptr<PresenceCoordinator> coordinator, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);

  void Run();

  bool Send(const WsEnvelope& envelope) override;
  bool IsOpen() const override;
  void Close(const std::string& reason) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void NotifyClosed(const std::string& reason);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void CloseWith(boost::beast::websocket::close_code code, const std::string& reason);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  UserIdentity user_;
  std::shared_ptr<PresenceCoordinator> coordinator_;
  // 아래 송신 상태는 ws_ 실행기(strand)에서만 접근한다.
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
  std::atomic<bool> closing_{false};
  std::atomic<bool> closed_notified_{false};
};

}  // namespace presence
