/*
 * 설명: 구조화 로그(JSON 한 줄)와 간단한 메트릭 카운터를 관리한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace doodle {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);
const char* ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> player;
  std::optional<std::string> game_id;
  std::string name;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t messages_in{0};
  std::uint64_t messages_rejected{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* out = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementMessage();
  void IncrementRejected();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  // HTTP 요청 단위 로그
  void Log(const LogContext& ctx) const;
  void Log(LogLevel level, const std::string& name, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  void Write(const nlohmann::json& line) const;

  LogLevel min_level_;
  std::ostream* out_;
  mutable std::mutex write_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> messages_in_{0};
  std::atomic<std::uint64_t> messages_rejected_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace doodle
