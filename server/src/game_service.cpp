/*
 * 설명: 게임 세션 strand 구동과 이벤트 전달을 구현한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "doodle/game_service.hpp"

#include <future>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace doodle {

GameService::GameService(boost::asio::io_context& ioc, const GameSettings& settings,
                         std::chrono::milliseconds tick_interval, std::size_t store_threads,
                         std::shared_ptr<WordStore> word_store, std::shared_ptr<UserStore> user_store,
                         std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)),
      registry_(std::make_shared<ConnectionRegistry>()),
      scheduler_(std::make_shared<AsioScheduler>(strand_, tick_interval)),
      store_executor_(std::make_shared<PooledStoreExecutor>(strand_, store_threads)),
      user_store_(std::move(user_store)) {
  registry_->SetObservability(observability);
  GameSession::Dependencies deps{registry_, scheduler_, store_executor_, std::move(word_store), user_store_,
                                 std::move(observability)};
  session_ = std::make_shared<GameSession>(settings, std::move(deps));
}

GameService::~GameService() { Shutdown(); }

void GameService::Opened(std::shared_ptr<Connection> connection) {
  boost::asio::post(strand_, [session = session_, connection = std::move(connection)]() {
    session->HandleOpen(connection);
  });
}

void GameService::Deliver(std::shared_ptr<Connection> connection, ClientMessage message) {
  boost::asio::post(strand_, [session = session_, connection = std::move(connection),
                              message = std::move(message)]() { session->HandleMessage(connection, message); });
}

void GameService::Closed(std::shared_ptr<Connection> connection) {
  boost::asio::post(strand_, [session = session_, connection = std::move(connection)]() {
    session->HandleClose(connection);
  });
}

GameStatus GameService::Status() {
  std::promise<GameStatus> done;
  boost::asio::dispatch(strand_, [session = session_, &done]() { done.set_value(session->Status()); });
  return done.get_future().get();
}

void GameService::Shutdown() { store_executor_->Shutdown(); }

}  // namespace doodle
