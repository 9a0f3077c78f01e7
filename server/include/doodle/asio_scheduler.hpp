/*
 * 설명: strand에 묶인 steady_timer로 Scheduler를 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/asio_scheduler_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "doodle/scheduler.hpp"

namespace doodle {

using GameStrand = boost::asio::strand<boost::asio::io_context::executor_type>;

class AsioScheduler : public Scheduler {
 public:
  AsioScheduler(GameStrand strand, std::chrono::milliseconds unit);

  std::shared_ptr<ScheduledTimer> Start(TickFn tick, DoneFn on_done) override;

 private:
  GameStrand strand_;
  std::chrono::milliseconds unit_;
};

}  // namespace doodle
