/*
 * 설명: 게임 코어가 사용하는 연결 추상화(유니캐스트 전송, 강제 종료)를 정의한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace doodle {

class Connection {
 public:
  virtual ~Connection() = default;

  virtual void SendEvent(const std::string& event, const nlohmann::json& payload) = 0;
  virtual void Disconnect(const std::string& reason) = 0;
  virtual bool IsOpen() const = 0;
  virtual std::string Describe() const = 0;
};

}  // namespace doodle
