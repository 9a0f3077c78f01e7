/*
 * 설명: MariaDB 연결, 쿼리 헬퍼와 재시도 로직을 구현한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "doodle/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace doodle {
namespace {
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
constexpr std::size_t kBackoffBaseMs = 50;
constexpr int kBackoffJitterMs = 25;

// mysql_init으로 얻은 핸들을 범위를 벗어날 때 닫는다.
class ConnectionGuard {
 public:
  explicit ConnectionGuard(MYSQL* conn) : conn_(conn) {}
  ~ConnectionGuard() {
    if (conn_) {
      mysql_close(conn_);
    }
  }
  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;

  MYSQL* get() const { return conn_; }

 private:
  MYSQL* conn_;
};
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {
  if (config_.max_attempts == 0) {
    config_.max_attempts = 1;
  }
}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout_seconds);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &config_.query_timeout_seconds);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &config_.query_timeout_seconds);
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    ConnectionGuard guard{conn};
    RaiseError(conn, "연결 실패");
  }
  return conn;
}

template <typename Fn>
auto MariaDbClient::Retry(const char* operation, Fn&& fn) const -> decltype(fn(static_cast<MYSQL*>(nullptr))) {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      ConnectionGuard guard{Connect()};
      return fn(guard.get());
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= config_.max_attempts) {
        throw;
      }
      if (observability_) {
        observability_->Log(LogLevel::kWarn, "db.retry",
                            {{"operation", operation}, {"attempt", attempt}, {"code", ex.code}, {"error", ex.what()}});
      }
      Backoff(attempt);
    }
  }
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  return Retry("transaction", [&](MYSQL* conn) {
    mysql_autocommit(conn, 0);
    bool commit = false;
    try {
      commit = work(conn);
    } catch (const std::exception&) {
      mysql_rollback(conn);
      throw;
    }
    if (!commit) {
      mysql_rollback(conn);
      return false;
    }
    if (mysql_commit(conn) != 0) {
      RaiseError(conn, "커밋 실패");
    }
    return true;
  });
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  Retry("statement", [&](MYSQL* conn) { work(conn); });
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
    RaiseError(conn, ctx);
  }
}

MysqlResult MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  Execute(conn, sql, ctx);
  MysqlResult res{mysql_store_result(conn)};
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  return res;
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped(value.size() * 2 + 1, '\0');
  const auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  const unsigned int code = mysql_errno(conn);
  throw DbException(ctx + ": " + mysql_error(conn), code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) {
  switch (code) {
    case kDeadlock:
    case kLockWaitTimeout:
    case CR_SERVER_LOST:
    case CR_SERVER_GONE_ERROR:
    case CR_CONN_HOST_ERROR:
    case CR_SERVER_LOST_EXTENDED:
      return true;
    default:
      return false;
  }
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<int> jitter(0, kBackoffJitterMs);
  const std::size_t delay_ms = kBackoffBaseMs * (std::size_t{1} << (attempt - 1)) + static_cast<std::size_t>(jitter(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

}  // namespace doodle
