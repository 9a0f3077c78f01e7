/*
 * 설명: 로그인 토큰과 플레이어 점수를 메모리/MariaDB에 저장한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/user_store_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#include "doodle/user_store.hpp"

#include <cctype>
#include <sstream>

#include "doodle/random_token.hpp"

namespace doodle {
namespace {
constexpr std::size_t kTokenBytes = 16;

int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
}  // namespace

bool IsValidLogin(const std::string& login) {
  if (login.empty() || login.size() > kMaxLoginLength) {
    return false;
  }
  if (std::isspace(static_cast<unsigned char>(login.front())) ||
      std::isspace(static_cast<unsigned char>(login.back()))) {
    return false;
  }
  for (char c : login) {
    if (std::iscntrl(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

InMemoryUserStore::InMemoryUserStore(std::chrono::seconds token_ttl) : token_ttl_(token_ttl) {}

std::string InMemoryUserStore::IssueToken(const std::string& login) {
  auto token = RandomHex(kTokenBytes);
  std::lock_guard<std::mutex> lock(mutex_);
  tokens_[token] = PendingToken{login, std::chrono::steady_clock::now() + token_ttl_};
  records_.emplace(login, UserRecord{login, 0, ""});
  return token;
}

std::optional<UserRecord> InMemoryUserStore::FindByToken(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    return std::nullopt;
  }
  auto pending = it->second;
  tokens_.erase(it);
  if (std::chrono::steady_clock::now() > pending.expires_at) {
    return std::nullopt;
  }
  auto record_it = records_.find(pending.login);
  if (record_it == records_.end()) {
    return UserRecord{pending.login, 0, ""};
  }
  return record_it->second;
}

void InMemoryUserStore::PersistScore(const std::string& identity, int score, const std::string& game_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[identity] = UserRecord{identity, score, game_id};
}

std::optional<UserRecord> InMemoryUserStore::Find(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(identity);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

MariaDbUserStore::MariaDbUserStore(std::shared_ptr<MariaDbClient> db_client, std::chrono::seconds token_ttl)
    : db_client_(std::move(db_client)), token_ttl_(token_ttl) {}

void MariaDbUserStore::EnsureSchema() {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS players ("
                        "name VARCHAR(32) NOT NULL PRIMARY KEY,"
                        "score INT NOT NULL DEFAULT 0,"
                        "last_game_id VARCHAR(64) NOT NULL DEFAULT '',"
                        "updated_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6)"
                        ") DEFAULT CHARSET=utf8mb4;",
                        "players 테이블 생성 실패");
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS login_tokens ("
                        "token CHAR(32) NOT NULL PRIMARY KEY,"
                        "name VARCHAR(32) NOT NULL,"
                        "issued_at DATETIME(6) NOT NULL"
                        ") DEFAULT CHARSET=utf8mb4;",
                        "login_tokens 테이블 생성 실패");
  });
}

std::string MariaDbUserStore::IssueToken(const std::string& login) {
  auto token = RandomHex(kTokenBytes);
  const bool issued = db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto name = db_client_->Escape(conn, login);
    std::ostringstream insert_token;
    insert_token << "INSERT INTO login_tokens(token, name, issued_at) VALUES('" << token << "', '" << name
                 << "', NOW(6));";
    db_client_->Execute(conn, insert_token.str(), "로그인 토큰 저장 실패");
    std::ostringstream insert_player;
    insert_player << "INSERT IGNORE INTO players(name, score, last_game_id) VALUES('" << name << "', 0, '');";
    db_client_->Execute(conn, insert_player.str(), "플레이어 생성 실패");
    return true;
  });
  if (!issued) {
    throw DbException("로그인 토큰 발급 실패", 0, false);
  }
  return token;
}

std::optional<UserRecord> MariaDbUserStore::FindByToken(const std::string& token) {
  std::optional<UserRecord> record;
  // 토큰이 없으면 롤백하고 false가 돌아온다.
  const bool consumed = db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    record.reset();
    auto escaped = db_client_->Escape(conn, token);
    std::ostringstream select_token;
    select_token << "SELECT name, issued_at > NOW(6) - INTERVAL " << token_ttl_.count()
                 << " SECOND FROM login_tokens WHERE token='" << escaped << "' FOR UPDATE;";
    std::string name;
    bool fresh = false;
    {
      auto res = db_client_->Query(conn, select_token.str(), "로그인 토큰 조회 실패");
      MYSQL_ROW row = mysql_fetch_row(res.get());
      if (!row || !row[0]) {
        return false;
      }
      name = row[0];
      fresh = ToInt(row[1]) == 1;
    }
    std::ostringstream delete_token;
    delete_token << "DELETE FROM login_tokens WHERE token='" << escaped << "';";
    db_client_->Execute(conn, delete_token.str(), "로그인 토큰 삭제 실패");
    if (!fresh) {
      return true;
    }
    std::ostringstream select_player;
    select_player << "SELECT name, score, last_game_id FROM players WHERE name='" << db_client_->Escape(conn, name)
                  << "';";
    auto res = db_client_->Query(conn, select_player.str(), "플레이어 조회 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row && row[0]) {
      record = UserRecord{row[0], ToInt(row[1]), row[2] ? row[2] : ""};
    } else {
      record = UserRecord{name, 0, ""};
    }
    return true;
  });
  if (!consumed) {
    return std::nullopt;
  }
  return record;
}

void MariaDbUserStore::PersistScore(const std::string& identity, int score, const std::string& game_id) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO players(name, score, last_game_id, updated_at) VALUES('" << db_client_->Escape(conn, identity)
        << "', " << score << ", '" << db_client_->Escape(conn, game_id) << "', NOW(6)) "
        << "ON DUPLICATE KEY UPDATE score=VALUES(score), last_game_id=VALUES(last_game_id), updated_at=NOW(6);";
    db_client_->Execute(conn, oss.str(), "점수 저장 실패");
  });
}

std::optional<UserRecord> MariaDbUserStore::Find(const std::string& identity) const {
  std::optional<UserRecord> record;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT name, score, last_game_id FROM players WHERE name='" << db_client_->Escape(conn, identity) << "';";
    auto res = db_client_->Query(conn, oss.str(), "플레이어 조회 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row && row[0]) {
      record = UserRecord{row[0], ToInt(row[1]), row[2] ? row[2] : ""};
    }
  });
  return record;
}

}  // namespace doodle
