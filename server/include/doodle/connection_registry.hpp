/*
 * 설명: 플레이어 식별자와 활성 연결을 양방향으로 매핑하고 식별자당 연결 하나만 유지한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "doodle/connection.hpp"
#include "doodle/observability.hpp"

namespace doodle {

class ConnectionRegistry {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  // 같은 식별자의 이전 연결은 매핑에서 제거되고 강제 종료된다. 제거된 연결을 반환한다.
  std::shared_ptr<Connection> Register(const std::string& identity, const std::shared_ptr<Connection>& connection);
  std::optional<std::string> Unregister(const Connection* connection);
  std::optional<std::string> Resolve(const Connection* connection) const;
  std::shared_ptr<Connection> Find(const std::string& identity) const;
  std::vector<std::pair<std::string, std::shared_ptr<Connection>>> Snapshot() const;
  std::size_t Size() const;

 private:
  struct Entry {
    std::weak_ptr<Connection> connection;
    const Connection* raw{nullptr};
  };

  void PublishSize();

  std::unordered_map<std::string, Entry> by_identity_;
  std::unordered_map<const Connection*, std::string> by_connection_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace doodle
