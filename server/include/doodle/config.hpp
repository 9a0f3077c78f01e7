/*
 * 설명: 서버 환경설정 로딩, 기본값, 검증을 정의한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "doodle/game_session.hpp"

namespace doodle {

struct AppConfig {
  unsigned short port;
  std::string store_backend;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::size_t login_token_ttl_seconds;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t store_worker_threads;
  std::size_t game_tick_interval_ms;
  GameSettings game;
};

AppConfig LoadConfigFromEnv();
// 범위를 벗어난 값이 있으면 std::invalid_argument를 던진다.
void ValidateConfig(const AppConfig& config);

}  // namespace doodle
