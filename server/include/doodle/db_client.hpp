/*
 * 설명: MariaDB 연결과 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

#include "doodle/observability.hpp"

namespace doodle {

struct DbConfig {
  std::string host;
  unsigned short port{3306};
  std::string user;
  std::string password;
  std::string database;
  unsigned int connect_timeout_seconds{2};
  unsigned int query_timeout_seconds{2};
  // 재시도 가능한 오류(교착, 락 대기 초과, 연결 끊김)에 대한 총 시도 횟수
  std::size_t max_attempts{3};
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}

  unsigned int code;
  bool retryable;
};

struct MysqlResultDeleter {
  void operator()(MYSQL_RES* res) const {
    if (res) {
      mysql_free_result(res);
    }
  }
};

using MysqlResult = std::unique_ptr<MYSQL_RES, MysqlResultDeleter>;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  // work가 true를 반환하면 커밋, false면 롤백하고 그 값을 돌려준다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  MysqlResult Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;
  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  template <typename Fn>
  auto Retry(const char* operation, Fn&& fn) const -> decltype(fn(static_cast<MYSQL*>(nullptr)));

  MYSQL* Connect() const;
  static bool IsRetryable(unsigned int code);
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace doodle
