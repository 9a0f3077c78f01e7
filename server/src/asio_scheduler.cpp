/*
 * 설명: strand 위에서 순차적으로 실행되는 반복 타이머를 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/asio_scheduler_test.cpp
 */
#include "doodle/asio_scheduler.hpp"

#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace doodle {
namespace {

class AsioTimer : public ScheduledTimer, public std::enable_shared_from_this<AsioTimer> {
 public:
  AsioTimer(GameStrand strand, std::chrono::milliseconds unit, Scheduler::TickFn tick, Scheduler::DoneFn on_done)
      : strand_(std::move(strand)), timer_(strand_), unit_(unit), tick_(std::move(tick)),
        on_done_(std::move(on_done)) {}

  void Begin() {
    boost::asio::post(strand_, [self = shared_from_this()]() { self->Fire(); });
  }

  void Cancel() override {
    if (!active_) {
      return;
    }
    active_ = false;
    timer_.cancel();
  }

  bool Active() const override { return active_; }

 private:
  void Fire() {
    if (!active_) {
      return;
    }
    const bool stop = tick_(elapsed_);
    // tick 안에서 취소되었을 수 있다.
    if (!active_) {
      return;
    }
    if (stop) {
      active_ = false;
      auto done = std::move(on_done_);
      on_done_ = nullptr;
      if (done) {
        done();
      }
      return;
    }
    ++elapsed_;
    timer_.expires_after(unit_);
    timer_.async_wait(boost::asio::bind_executor(
        strand_, [self = shared_from_this()](const boost::system::error_code& ec) {
          if (!ec) {
            self->Fire();
          }
        }));
  }

  GameStrand strand_;
  boost::asio::steady_timer timer_;
  std::chrono::milliseconds unit_;
  Scheduler::TickFn tick_;
  Scheduler::DoneFn on_done_;
  int elapsed_{0};
  bool active_{true};
};

}  // namespace

AsioScheduler::AsioScheduler(GameStrand strand, std::chrono::milliseconds unit)
    : strand_(std::move(strand)), unit_(unit) {}

std::shared_ptr<ScheduledTimer> AsioScheduler::Start(TickFn tick, DoneFn on_done) {
  auto timer = std::make_shared<AsioTimer>(strand_, unit_, std::move(tick), std::move(on_done));
  timer->Begin();
  return timer;
}

}  // namespace doodle
