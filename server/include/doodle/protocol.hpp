/*
 * 설명: 게임 메시지 유형(닫힌 enum)과 클라이언트 메시지 variant, 그리기 연산 variant를 정의한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace doodle {

enum class MessageType {
  kHandshake,
  kDraw,
  kChat,
  kWordChoices,
  kStartRound,
  kEndRound,
  kPlayer,
  kPlayerDisconnected,
  kTimer,
  kWord,
  kGameOver,
};

std::string_view ToEventName(MessageType type);
std::optional<MessageType> ParseMessageType(std::string_view event);

struct Stroke {
  std::string tool;
  double x{0};
  double y{0};
  double prev_x{0};
  double prev_y{0};
};

struct ClearCanvas {};

using DrawOp = std::variant<Stroke, ClearCanvas>;

nlohmann::json ToJson(const DrawOp& op);

struct HandshakeMessage {
  std::string token;
};

struct DrawMessage {
  DrawOp op;
};

struct ChatMessage {
  std::string sender;
  std::string text;
  std::string color;
};

struct WordChoiceMessage {
  std::string word;
};

using ClientMessage = std::variant<HandshakeMessage, DrawMessage, ChatMessage, WordChoiceMessage>;

struct ParseError {
  std::string code;
  std::string message;
};

// 클라이언트가 보낼 수 없는 유형(server→client 전용)은 unknown_event로 거절한다.
std::optional<ClientMessage> ParseClientMessage(std::string_view event, const nlohmann::json& payload,
                                                ParseError& error);

nlohmann::json ToJson(const ChatMessage& chat);

}  // namespace doodle
