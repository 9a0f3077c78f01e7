/*
 * 설명: REST 응답 엔벨로프와 WS 프레임 엔벨로프 생성을 담당한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace doodle {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
// detail은 검증 실패 위치처럼 기계가 읽을 부가 정보를 담는다.
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

std::string MakeEventFrame(std::string_view event, const nlohmann::json& payload);
std::string MakeErrorFrame(std::string_view code, std::string_view message, std::uint64_t seq);

}  // namespace doodle
