/*
 * 설명: WS 이벤트/확인/오류 엔벨로프와 핸드셰이크 거절 응답 엔벨로프를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace presence {

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

WsEnvelope MakeEventEnvelope(const std::string& event, const nlohmann::json& payload);
WsEnvelope MakeAckEnvelope(const std::string& event, std::uint64_t seq, const nlohmann::json& payload);
WsEnvelope MakeWsErrorEnvelope(std::string_view code, std::string_view message, std::uint64_t seq);

// 클라이언트 프레임 {"t":"event","seq":N,"event":"...","p":...}을 해석한다.
// 형식이 잘못되면 nullopt를 돌려주고 error_message에 사유를 남긴다.
std::optional<WsEnvelope> ParseWsFrame(const std::string& frame, std::string& error_message);

std::string ToIsoString(std::chrono::system_clock::time_point tp);

}  // namespace presence
