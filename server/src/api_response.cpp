/*
 * 설명: JSON 엔벨로프를 생성하고 WS 프레임을 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "presence/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace presence {

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
  return oss.str();
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "error") {
    j["event"] = nullptr;
  } else {
    j["event"] = env.event;
  }
  j["p"] = env.payload;
  return j;
}

WsEnvelope MakeEventEnvelope(const std::string& event, const nlohmann::json& payload) {
  return WsEnvelope{.type = "event", .event = event, .seq = 0, .payload = payload};
}

WsEnvelope MakeAckEnvelope(const std::string& event, std::uint64_t seq, const nlohmann::json& payload) {
  return WsEnvelope{.type = "ack", .event = event, .seq = seq, .payload = payload};
}

WsEnvelope MakeWsErrorEnvelope(std::string_view code, std::string_view message, std::uint64_t seq) {
  return WsEnvelope{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
}

std::optional<WsEnvelope> ParseWsFrame(const std::string& frame, std::string& error_message) {
  auto message = nlohmann::json::parse(frame, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  WsEnvelope env{.type = "", .event = "", .seq = 0, .payload = nullptr};
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    env.seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  if (type_it == message.end() || !type_it->is_string()) {
    error_message = "잘못된 메시지 형식";
    return std::nullopt;
  }
  env.type = type_it->get<std::string>();
  if (env.type != "event") {
    error_message = "알 수 없는 메시지 유형";
    return std::nullopt;
  }
  auto event_it = message.find("event");
  if (event_it == message.end() || !event_it->is_string() || event_it->get<std::string>().empty()) {
    error_message = "event 필드가 필요합니다";
    return std::nullopt;
  }
  env.event = event_it->get<std::string>();
  auto payload_it = message.find("p");
  if (payload_it != message.end()) {
    env.payload = *payload_it;
  }
  return env;
}

}  // namespace presence
