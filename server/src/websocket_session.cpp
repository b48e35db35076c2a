/*
 * 설명: WebSocket 프레임을 읽어 코디네이터 strand로 전달하고, 송신 큐와 백프레셔 종료를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/websocket_session_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#include "presence/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace presence {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   const UserIdentity& user, std::shared_ptr<PresenceCoordinator> coordinator,
                                   std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : ws_(std::move(ws)), user_(user), coordinator_(std::move(coordinator)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

void WebSocketSession::Run() {
  auto self = shared_from_this();
  coordinator_->Post([self]() { self->coordinator_->Connect(self->user_, self); });
  DoRead();
}

bool WebSocketSession::Send(const WsEnvelope& envelope) {
  if (closing_) {
    return false;
  }
  auto frame = ToWsJson(envelope).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(),
                    [self, frame = std::move(frame)]() mutable { self->EnqueueMessage(std::move(frame)); });
  return true;
}

bool WebSocketSession::IsOpen() const { return !closing_; }

void WebSocketSession::Close(const std::string& reason) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, reason]() {
    self->CloseWith(boost::beast::websocket::close_code::normal, reason);
  });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    closing_ = true;
    NotifyClosed(ec == boost::beast::websocket::error::closed ? "client_closed" : ec.message());
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  std::string error_message;
  auto inbound = ParseWsFrame(data, error_message);
  if (!inbound) {
    Send(MakeWsErrorEnvelope("bad_request", error_message, 0));
  } else {
    auto self = shared_from_this();
    coordinator_->Post([self, envelope = std::move(*inbound)]() {
      self->coordinator_->Dispatch(self->user_, self, envelope);
    });
  }
  DoRead();
}

void WebSocketSession::NotifyClosed(const std::string& reason) {
  bool expected = false;
  if (!closed_notified_.compare_exchange_strong(expected, true)) {
    return;
  }
  auto self = shared_from_this();
  coordinator_->Post([self, reason]() { self->coordinator_->Disconnect(self->user_, self.get(), reason); });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    CloseWith(boost::beast::websocket::close_code::policy_error, "backpressure_exceeded");
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    NotifyClosed("write_failed");
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::CloseWith(boost::beast::websocket::close_code code, const std::string& reason) {
  bool expected = false;
  if (!closing_.compare_exchange_strong(expected, true)) {
    return;
  }
  // 진행 중인 async_write가 앞 프레임 버퍼를 참조하므로 OnWrite가 꺼낼 때까지 남겨 둔다.
  if (writing_ && !send_queue_.empty()) {
    send_queue_.erase(send_queue_.begin() + 1, send_queue_.end());
    queued_bytes_ = send_queue_.front().size();
  } else {
    send_queue_.clear();
    queued_bytes_ = 0;
  }
  boost::beast::websocket::close_reason close_reason{code};
  close_reason.reason = reason;
  auto self = shared_from_this();
  ws_.async_close(close_reason, [self, reason](boost::beast::error_code) { self->NotifyClosed(reason); });
}

}  // namespace presence
