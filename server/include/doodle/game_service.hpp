/*
 * 설명: 게임 세션을 단일 strand 위에서 구동하고 연결 이벤트/상태 조회를 그 strand로 전달한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include <boost/asio/io_context.hpp>

#include "doodle/asio_scheduler.hpp"
#include "doodle/connection.hpp"
#include "doodle/connection_registry.hpp"
#include "doodle/game_session.hpp"
#include "doodle/observability.hpp"
#include "doodle/protocol.hpp"
#include "doodle/store_executor.hpp"
#include "doodle/user_store.hpp"
#include "doodle/word_store.hpp"

namespace doodle {

class GameService {
 public:
  GameService(boost::asio::io_context& ioc, const GameSettings& settings, std::chrono::milliseconds tick_interval,
              std::size_t store_threads, std::shared_ptr<WordStore> word_store,
              std::shared_ptr<UserStore> user_store, std::shared_ptr<Observability> observability);
  ~GameService();

  GameService(const GameService&) = delete;
  GameService& operator=(const GameService&) = delete;

  void Opened(std::shared_ptr<Connection> connection);
  void Deliver(std::shared_ptr<Connection> connection, ClientMessage message);
  void Closed(std::shared_ptr<Connection> connection);

  // 호출 스레드를 막고 strand 위에서 만든 스냅샷을 기다린다. strand 안에서 호출하면 안 된다.
  GameStatus Status();
  std::shared_ptr<UserStore> GetUserStore() { return user_store_; }
  void Shutdown();

 private:
  GameStrand strand_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<AsioScheduler> scheduler_;
  std::shared_ptr<PooledStoreExecutor> store_executor_;
  std::shared_ptr<UserStore> user_store_;
  std::shared_ptr<GameSession> session_;
};

}  // namespace doodle
