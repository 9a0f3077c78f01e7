/*
 * 설명: 서버 전체 수명주기(저장소 준비, 게임 서비스, 리스너, 워커 스레드)를 관리한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "doodle/config.hpp"
#include "doodle/db_client.hpp"
#include "doodle/game_service.hpp"
#include "doodle/observability.hpp"
#include "doodle/user_store.hpp"
#include "doodle/word_store.hpp"

namespace doodle {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<GameService> GetGameService() { return game_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void PrepareStores();
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<WordStore> word_store_;
  std::shared_ptr<UserStore> user_store_;
  std::shared_ptr<GameService> game_service_;
  std::shared_ptr<Listener> listener_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace doodle
