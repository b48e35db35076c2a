/*
 * 설명: 업그레이드 요청의 Bearer 헤더 또는 token 쿼리를 확인해 핸드셰이크를 수락/거절한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/presence_flow_test.cpp
 */
#include "presence/http_session.hpp"

#include <optional>
#include <unordered_map>

#include <boost/beast/version.hpp>

#include "presence/api_response.hpp"
#include "presence/websocket_session.hpp"

namespace presence {

namespace {
constexpr const char* kServerName = "presence-core";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::string ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size() || header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

std::string PathOf(const std::string& target) {
  auto qpos = target.find('?');
  return qpos == std::string::npos ? target : target.substr(0, qpos);
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<IdentityResolver> identity_resolver,
                         std::shared_ptr<PresenceCoordinator> coordinator,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), identity_resolver_(std::move(identity_resolver)),
      coordinator_(std::move(coordinator)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();

  if (PathOf(std::string(req_.target())) != "/ws") {
    return SendError(boost::beast::http::status::not_found, "not_found", "지원하지 않는 경로입니다");
  }
  if (!boost::beast::websocket::is_upgrade(req_)) {
    return SendError(boost::beast::http::status::bad_request, "bad_request", "WebSocket 업그레이드 요청이 필요합니다");
  }
  HandleWebSocket();
}

void HttpSession::HandleWebSocket() {
  auto credential = ExtractCredential();
  std::optional<UserIdentity> user;
  if (!credential.empty()) {
    user = identity_resolver_->Resolve(credential);
  }
  if (!user) {
    observability_->IncrementHandshake(false);
    return SendError(boost::beast::http::status::unauthorized, "unauthorized",
                     "WS 업그레이드에는 유효한 토큰이 필요합니다");
  }
  observability_->IncrementHandshake(true);

  stream_.expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    observability_->Log(LogContext{.level = LogLevel::kWarn,
                                   .trace_id = trace_id_,
                                   .user_id = user->user_id,
                                   .name = "handshake.accept_failed",
                                   .detail = {{"error", ec.message()}}});
    return;
  }
  auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                        request_start_)
                     .count();
  observability_->Log(LogContext{.level = LogLevel::kInfo,
                                 .trace_id = trace_id_,
                                 .user_id = user->user_id,
                                 .name = "handshake.accepted",
                                 .latency_ms = static_cast<long>(latency)});
  std::make_shared<WebSocketSession>(std::move(ws), *user, coordinator_, config_.ws_queue_limit_messages,
                                     config_.ws_queue_limit_bytes)
      ->Run();
}

void HttpSession::SendError(boost::beast::http::status status, std::string_view code, std::string_view message) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  auto body = MakeErrorEnvelope(code, message).dump();
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                       request_start_)
                     .count();
  observability_->Log(LogContext{.level = LogLevel::kWarn,
                                 .trace_id = trace_id_,
                                 .name = "http.rejected",
                                 .latency_ms = static_cast<long>(latency),
                                 .detail = {{"status", res->result_int()}, {"target", std::string(req_.target())}}});
  auto self = shared_from_this();
  boost::beast::http::async_write(stream_, *res,
                                  [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                    if (ec) {
                                      return;
                                    }
                                    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
                                  });
}

std::string HttpSession::ExtractCredential() const {
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it != req_.end()) {
    auto token = ParseBearer(std::string(auth_it->value()));
    if (!token.empty()) {
      return token;
    }
  }
  std::string target(req_.target());
  auto qpos = target.find('?');
  if (qpos == std::string::npos) {
    return "";
  }
  auto params = ParseQueryParams(target.substr(qpos + 1));
  auto it = params.find("token");
  return it == params.end() ? std::string() : it->second;
}

}  // namespace presence
