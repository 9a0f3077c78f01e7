/*
 * 설명: 로그인 토큰 발급/소비와 플레이어 점수 저장을 담당하는 사용자 저장소를 정의한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/user_store_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "doodle/db_client.hpp"

namespace doodle {

constexpr std::size_t kMaxLoginLength = 32;

struct UserRecord {
  std::string identity;
  int score{0};
  std::string last_game_id;
};

// 앞뒤 공백이 없고 제어 문자가 없는 1~32바이트 이름만 허용한다.
bool IsValidLogin(const std::string& login);

class UserStore {
 public:
  virtual ~UserStore() = default;

  virtual std::string IssueToken(const std::string& login) = 0;
  // 토큰은 한 번만 사용할 수 있다. 없거나 만료되었으면 nullopt.
  virtual std::optional<UserRecord> FindByToken(const std::string& token) = 0;
  virtual void PersistScore(const std::string& identity, int score, const std::string& game_id) = 0;
};

class InMemoryUserStore : public UserStore {
 public:
  explicit InMemoryUserStore(std::chrono::seconds token_ttl = std::chrono::seconds(600));

  std::string IssueToken(const std::string& login) override;
  std::optional<UserRecord> FindByToken(const std::string& token) override;
  void PersistScore(const std::string& identity, int score, const std::string& game_id) override;

  std::optional<UserRecord> Find(const std::string& identity) const;

 private:
  struct PendingToken {
    std::string login;
    std::chrono::steady_clock::time_point expires_at;
  };

  std::chrono::seconds token_ttl_;
  std::unordered_map<std::string, PendingToken> tokens_;
  std::unordered_map<std::string, UserRecord> records_;
  mutable std::mutex mutex_;
};

class MariaDbUserStore : public UserStore {
 public:
  MariaDbUserStore(std::shared_ptr<MariaDbClient> db_client, std::chrono::seconds token_ttl);

  void EnsureSchema();
  std::string IssueToken(const std::string& login) override;
  std::optional<UserRecord> FindByToken(const std::string& token) override;
  void PersistScore(const std::string& identity, int score, const std::string& game_id) override;

  std::optional<UserRecord> Find(const std::string& identity) const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
  std::chrono::seconds token_ttl_;
};

}  // namespace doodle
