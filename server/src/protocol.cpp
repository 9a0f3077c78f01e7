/*
 * 설명: 게임 메시지 유형 변환과 클라이언트 메시지 파싱/검증을 수행한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#include "doodle/protocol.hpp"

#include <array>
#include <utility>

namespace doodle {
namespace {
constexpr std::array<std::pair<MessageType, std::string_view>, 11> kEventNames{{
    {MessageType::kHandshake, "handshake"},
    {MessageType::kDraw, "draw"},
    {MessageType::kChat, "chat"},
    {MessageType::kWordChoices, "word-choices"},
    {MessageType::kStartRound, "start-round"},
    {MessageType::kEndRound, "end-round"},
    {MessageType::kPlayer, "player"},
    {MessageType::kPlayerDisconnected, "player-disconnected"},
    {MessageType::kTimer, "timer"},
    {MessageType::kWord, "word"},
    {MessageType::kGameOver, "game-over"},
}};

constexpr std::string_view kClearTool = "clear";
constexpr std::size_t kMaxChatLength = 512;
constexpr std::size_t kMaxFieldLength = 64;

bool ReadString(const nlohmann::json& payload, const char* key, std::string& out, std::size_t max_len) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return out.size() <= max_len;
}

bool ReadNumber(const nlohmann::json& payload, const char* key, double& out) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_number()) {
    return false;
  }
  out = it->get<double>();
  return true;
}

ParseError Fail(const char* code, const char* message) { return ParseError{code, message}; }

std::optional<ClientMessage> ParseDraw(const nlohmann::json& payload, ParseError& error) {
  std::string tool;
  if (!ReadString(payload, "tool", tool, kMaxFieldLength)) {
    error = Fail("bad_request", "tool 필드가 필요합니다");
    return std::nullopt;
  }
  if (tool == kClearTool) {
    return DrawMessage{ClearCanvas{}};
  }
  Stroke stroke;
  stroke.tool = tool;
  if (!ReadNumber(payload, "x", stroke.x) || !ReadNumber(payload, "y", stroke.y) ||
      !ReadNumber(payload, "prevX", stroke.prev_x) || !ReadNumber(payload, "prevY", stroke.prev_y)) {
    error = Fail("bad_request", "x, y, prevX, prevY 좌표가 필요합니다");
    return std::nullopt;
  }
  return DrawMessage{stroke};
}
}  // namespace

std::string_view ToEventName(MessageType type) {
  for (const auto& [candidate, name] : kEventNames) {
    if (candidate == type) {
      return name;
    }
  }
  return "unknown";
}

std::optional<MessageType> ParseMessageType(std::string_view event) {
  for (const auto& [type, name] : kEventNames) {
    if (name == event) {
      return type;
    }
  }
  return std::nullopt;
}

nlohmann::json ToJson(const DrawOp& op) {
  if (const auto* stroke = std::get_if<Stroke>(&op)) {
    return {{"tool", stroke->tool},
            {"x", stroke->x},
            {"y", stroke->y},
            {"prevX", stroke->prev_x},
            {"prevY", stroke->prev_y}};
  }
  return {{"tool", kClearTool}};
}

nlohmann::json ToJson(const ChatMessage& chat) {
  return {{"sender", chat.sender}, {"text", chat.text}, {"color", chat.color}};
}

std::optional<ClientMessage> ParseClientMessage(std::string_view event, const nlohmann::json& payload,
                                                ParseError& error) {
  if (!payload.is_object()) {
    error = Fail("bad_request", "payload가 누락되었습니다");
    return std::nullopt;
  }
  auto type = ParseMessageType(event);
  if (!type) {
    error = Fail("unknown_event", "알 수 없는 이벤트");
    return std::nullopt;
  }
  switch (*type) {
    case MessageType::kHandshake: {
      HandshakeMessage msg;
      if (!ReadString(payload, "token", msg.token, 256) || msg.token.empty()) {
        error = Fail("bad_request", "token 필드가 필요합니다");
        return std::nullopt;
      }
      return msg;
    }
    case MessageType::kDraw:
      return ParseDraw(payload, error);
    case MessageType::kChat: {
      ChatMessage msg;
      if (!ReadString(payload, "text", msg.text, kMaxChatLength)) {
        error = Fail("bad_request", "text 필드가 필요합니다");
        return std::nullopt;
      }
      // sender/color는 선택 필드이며 sender는 서버가 다시 확인한다.
      if (!ReadString(payload, "sender", msg.sender, kMaxFieldLength)) {
        msg.sender.clear();
      }
      if (!ReadString(payload, "color", msg.color, kMaxFieldLength)) {
        msg.color.clear();
      }
      return msg;
    }
    case MessageType::kWord: {
      WordChoiceMessage msg;
      if (!ReadString(payload, "word", msg.word, kMaxFieldLength) || msg.word.empty()) {
        error = Fail("bad_request", "word 필드가 필요합니다");
        return std::nullopt;
      }
      return msg;
    }
    case MessageType::kWordChoices:
    case MessageType::kStartRound:
    case MessageType::kEndRound:
    case MessageType::kPlayer:
    case MessageType::kPlayerDisconnected:
    case MessageType::kTimer:
    case MessageType::kGameOver:
      break;
  }
  error = Fail("unknown_event", "클라이언트가 보낼 수 없는 이벤트입니다");
  return std::nullopt;
}

}  // namespace doodle
