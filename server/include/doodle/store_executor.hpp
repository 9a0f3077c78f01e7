/*
 * 설명: 블로킹 저장소 호출을 게임 루프 밖에서 실행하고 완료를 루프로 되돌린다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/store_executor_test.cpp, server/tests/unit/game_session_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "doodle/asio_scheduler.hpp"

namespace doodle {

template <typename T>
struct StoreResult {
  std::optional<T> value;
  std::string error;

  bool ok() const { return value.has_value(); }
};

class StoreExecutor {
 public:
  virtual ~StoreExecutor() = default;
  // work는 루프 밖에서, completion은 게임 루프에서 실행된다.
  virtual void Submit(std::function<void()> work, std::function<void()> completion) = 0;
};

class PooledStoreExecutor : public StoreExecutor {
 public:
  PooledStoreExecutor(GameStrand strand, std::size_t threads);
  ~PooledStoreExecutor() override;

  void Submit(std::function<void()> work, std::function<void()> completion) override;
  void Shutdown();

 private:
  GameStrand strand_;
  boost::asio::thread_pool pool_;
};

}  // namespace doodle
