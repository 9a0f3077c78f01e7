/*
 * 설명: 식별자-연결 매핑을 관리하고 중복 로그인 시 이전 연결을 축출한다.
 * 버전: v0.3.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "doodle/connection_registry.hpp"

namespace doodle {

std::shared_ptr<Connection> ConnectionRegistry::Register(const std::string& identity,
                                                         const std::shared_ptr<Connection>& connection) {
  std::shared_ptr<Connection> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto conn_it = by_connection_.find(connection.get());
    if (conn_it != by_connection_.end() && conn_it->second != identity) {
      by_identity_.erase(conn_it->second);
      by_connection_.erase(conn_it);
    }
    auto it = by_identity_.find(identity);
    if (it != by_identity_.end() && it->second.raw != connection.get()) {
      evicted = it->second.connection.lock();
      by_connection_.erase(it->second.raw);
    }
    by_identity_[identity] = Entry{connection, connection.get()};
    by_connection_[connection.get()] = identity;
    PublishSize();
  }
  // 락 밖에서 종료해야 연결 측 콜백이 레지스트리에 다시 들어와도 교착되지 않는다.
  if (evicted) {
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "connection.evicted",
                          {{"player", identity}, {"connection", evicted->Describe()}});
    }
    evicted->Disconnect("replaced_by_new_login");
  }
  return evicted;
}

std::optional<std::string> ConnectionRegistry::Unregister(const Connection* connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_connection_.find(connection);
  if (it == by_connection_.end()) {
    return std::nullopt;
  }
  std::string identity = it->second;
  by_connection_.erase(it);
  auto id_it = by_identity_.find(identity);
  if (id_it != by_identity_.end() && id_it->second.raw == connection) {
    by_identity_.erase(id_it);
  }
  PublishSize();
  return identity;
}

std::optional<std::string> ConnectionRegistry::Resolve(const Connection* connection) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_connection_.find(connection);
  if (it == by_connection_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::shared_ptr<Connection> ConnectionRegistry::Find(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_identity_.find(identity);
  if (it == by_identity_.end()) {
    return nullptr;
  }
  return it->second.connection.lock();
}

std::vector<std::pair<std::string, std::shared_ptr<Connection>>> ConnectionRegistry::Snapshot() const {
  std::vector<std::pair<std::string, std::shared_ptr<Connection>>> result;
  std::lock_guard<std::mutex> lock(mutex_);
  result.reserve(by_identity_.size());
  for (const auto& [identity, entry] : by_identity_) {
    if (auto conn = entry.connection.lock()) {
      result.emplace_back(identity, std::move(conn));
    }
  }
  return result;
}

std::size_t ConnectionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_identity_.size();
}

void ConnectionRegistry::PublishSize() {
  if (observability_) {
    observability_->SetWebsocketActive(by_identity_.size());
  }
}

}  // namespace doodle
