/*
 * 설명: REST 응답 엔벨로프와 WS 프레임을 생성하고 직렬화한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "doodle/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace doodle {
namespace {
// 2024-05-01T12:00:00.123Z 형식(UTC, 밀리초)
std::string UtcTimestamp() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t seconds = clock::to_time_t(now);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream ss;
  ss << std::put_time(&utc, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}

nlohmann::json Envelope(bool success, nlohmann::json data, nlohmann::json error) {
  return {{"success", success},
          {"data", std::move(data)},
          {"error", std::move(error)},
          {"meta", {{"timestamp", UtcTimestamp()}}}};
}

std::string Serialize(const nlohmann::json& frame) {
  // 잘못된 UTF-8이 섞인 채팅도 프레임 전체를 버리지 않고 치환해서 보낸다.
  return frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) { return Envelope(true, data, nullptr); }

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  return Envelope(false, nullptr, {{"code", code}, {"message", message}, {"detail", detail}});
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  const bool is_event = env.type == "event";
  return {{"t", env.type},
          {"seq", env.seq},
          {"event", is_event ? nlohmann::json(env.event) : nlohmann::json()},
          {"p", env.payload}};
}

std::string MakeEventFrame(std::string_view event, const nlohmann::json& payload) {
  return Serialize(ToWsJson(WsEnvelope{.type = "event", .event = std::string(event), .seq = 0, .payload = payload}));
}

std::string MakeErrorFrame(std::string_view code, std::string_view message, std::uint64_t seq) {
  return Serialize(ToWsJson(
      WsEnvelope{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}}));
}

}  // namespace doodle
