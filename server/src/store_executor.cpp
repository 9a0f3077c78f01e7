/*
 * 설명: thread_pool에서 저장소 작업을 수행하고 완료 콜백을 게임 strand로 게시한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/store_executor_test.cpp
 */
#include "doodle/store_executor.hpp"

#include <utility>

#include <boost/asio/post.hpp>

namespace doodle {

PooledStoreExecutor::PooledStoreExecutor(GameStrand strand, std::size_t threads)
    : strand_(std::move(strand)), pool_(threads) {}

PooledStoreExecutor::~PooledStoreExecutor() { Shutdown(); }

void PooledStoreExecutor::Submit(std::function<void()> work, std::function<void()> completion) {
  boost::asio::post(pool_, [strand = strand_, work = std::move(work), completion = std::move(completion)]() {
    work();
    boost::asio::post(strand, completion);
  });
}

void PooledStoreExecutor::Shutdown() {
  pool_.stop();
  pool_.join();
}

}  // namespace doodle
