/*
 * 설명: 레지스트리 스냅샷을 기준으로 메시지를 전달한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "doodle/message_bus.hpp"

namespace doodle {

MessageBus::MessageBus(std::shared_ptr<ConnectionRegistry> registry) : registry_(std::move(registry)) {}

void MessageBus::Send(Connection& connection, MessageType type, const nlohmann::json& payload) const {
  connection.SendEvent(std::string(ToEventName(type)), payload);
}

bool MessageBus::SendTo(const std::string& identity, MessageType type, const nlohmann::json& payload) const {
  auto connection = registry_->Find(identity);
  if (!connection) {
    return false;
  }
  Send(*connection, type, payload);
  return true;
}

void MessageBus::Broadcast(MessageType type, const nlohmann::json& payload) const {
  for (const auto& [identity, connection] : registry_->Snapshot()) {
    Send(*connection, type, payload);
  }
}

void MessageBus::BroadcastExcept(const std::string& identity, MessageType type, const nlohmann::json& payload) const {
  for (const auto& [other, connection] : registry_->Snapshot()) {
    if (other != identity) {
      Send(*connection, type, payload);
    }
  }
}

}  // namespace doodle
