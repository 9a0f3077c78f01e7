#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

#include "doodle/config.hpp"

namespace {

const char* const kConfigKeys[] = {"SERVER_PORT",
                                   "STORE_BACKEND",
                                   "DB_HOST",
                                   "DB_PORT",
                                   "DB_USER",
                                   "DB_PASSWORD",
                                   "DB_NAME",
                                   "LOG_LEVEL",
                                   "LOGIN_TOKEN_TTL_SECONDS",
                                   "WS_QUEUE_LIMIT_MESSAGES",
                                   "WS_QUEUE_LIMIT_BYTES",
                                   "STORE_WORKER_THREADS",
                                   "GAME_TICK_INTERVAL_MS",
                                   "GAME_MAX_ROUNDS",
                                   "GAME_ROUND_SECONDS",
                                   "GAME_CHOOSE_SECONDS",
                                   "GAME_COOLDOWN_SECONDS",
                                   "GAME_INTERMISSION_SECONDS",
                                   "GAME_WORD_CHOICES"};

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char* key : kConfigKeys) {
      unsetenv(key);
    }
  }
  void TearDown() override { SetUp(); }
};

TEST_F(ConfigTest, DefaultsWhenEnvironmentIsEmpty) {
  auto cfg = doodle::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.store_backend, "mariadb");
  EXPECT_EQ(cfg.db_port, 3306);
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.login_token_ttl_seconds, 600u);
  EXPECT_EQ(cfg.game_tick_interval_ms, 1000u);
  EXPECT_EQ(cfg.game.max_rounds, 3);
  EXPECT_EQ(cfg.game.round_time, 80);
  EXPECT_EQ(cfg.game.choose_word_time, 20);
  EXPECT_EQ(cfg.game.word_choices, 3u);
  EXPECT_NO_THROW(doodle::ValidateConfig(cfg));
}

TEST_F(ConfigTest, ReadsOverrides) {
  setenv("SERVER_PORT", "9090", 1);
  setenv("STORE_BACKEND", "memory", 1);
  setenv("GAME_ROUND_SECONDS", "30", 1);
  setenv("GAME_TICK_INTERVAL_MS", "50", 1);
  auto cfg = doodle::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9090);
  EXPECT_EQ(cfg.store_backend, "memory");
  EXPECT_EQ(cfg.game.round_time, 30);
  EXPECT_EQ(cfg.game_tick_interval_ms, 50u);
}

TEST_F(ConfigTest, NonNumericValueThrows) {
  setenv("GAME_MAX_ROUNDS", "many", 1);
  EXPECT_THROW(doodle::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsUnknownBackend) {
  auto cfg = doodle::LoadConfigFromEnv();
  cfg.store_backend = "redis";
  EXPECT_THROW(doodle::ValidateConfig(cfg), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
  auto cfg = doodle::LoadConfigFromEnv();
  cfg.log_level = "loud";
  EXPECT_THROW(doodle::ValidateConfig(cfg), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsNonPositiveDurations) {
  auto cfg = doodle::LoadConfigFromEnv();
  cfg.game.round_time = 0;
  EXPECT_THROW(doodle::ValidateConfig(cfg), std::invalid_argument);

  cfg = doodle::LoadConfigFromEnv();
  cfg.store_worker_threads = 0;
  EXPECT_THROW(doodle::ValidateConfig(cfg), std::invalid_argument);
}

TEST_F(ConfigTest, WordChoicesMustStayInRange) {
  auto cfg = doodle::LoadConfigFromEnv();
  cfg.game.word_choices = 2;
  EXPECT_THROW(doodle::ValidateConfig(cfg), std::invalid_argument);
  cfg.game.word_choices = 10;
  EXPECT_THROW(doodle::ValidateConfig(cfg), std::invalid_argument);
  cfg.game.word_choices = 9;
  EXPECT_NO_THROW(doodle::ValidateConfig(cfg));
}

}  // namespace
