/*
 * 설명: 레지스트리에 등록된 연결로 타입 지정 메시지를 유니캐스트/브로드캐스트한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "doodle/connection.hpp"
#include "doodle/connection_registry.hpp"
#include "doodle/protocol.hpp"

namespace doodle {

class MessageBus {
 public:
  explicit MessageBus(std::shared_ptr<ConnectionRegistry> registry);

  void Send(Connection& connection, MessageType type, const nlohmann::json& payload) const;
  bool SendTo(const std::string& identity, MessageType type, const nlohmann::json& payload) const;
  void Broadcast(MessageType type, const nlohmann::json& payload) const;
  void BroadcastExcept(const std::string& identity, MessageType type, const nlohmann::json& payload) const;

 private:
  std::shared_ptr<ConnectionRegistry> registry_;
};

}  // namespace doodle
