/*
 * 설명: HTTP 연결을 읽어 /ws 업그레이드 요청의 자격 증명을 확인하고 WebSocket 세션으로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "presence/config.hpp"
#include "presence/identity.hpp"
#include "presence/observability.hpp"
#include "presence/presence_coordinator.hpp"

namespace presence {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<IdentityResolver> identity_resolver,
              std::shared_ptr<PresenceCoordinator> coordinator, std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleWebSocket();
  void SendError(boost::beast::http::status status, std::string_view code, std::string_view message);
  void SendResponse(std::shared_ptr<Response> res);
  std::string ExtractCredential() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<IdentityResolver> identity_resolver_;
  std::shared_ptr<PresenceCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace presence
