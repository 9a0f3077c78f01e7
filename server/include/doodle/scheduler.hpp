/*
 * 설명: 반복 타이머 추상화. 게임의 모든 시간 기반 전이를 구동한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/asio_scheduler_test.cpp, server/tests/unit/game_session_test.cpp
 */
#pragma once

#include <functional>
#include <memory>

namespace doodle {

class ScheduledTimer {
 public:
  virtual ~ScheduledTimer() = default;
  // 멱등. 취소된 타이머는 tick도 on_done도 더 호출하지 않는다.
  virtual void Cancel() = 0;
  virtual bool Active() const = 0;
};

class Scheduler {
 public:
  // elapsed는 시작 이후 지난 시간 단위 수. true를 반환하면 타이머가 멈춘다.
  using TickFn = std::function<bool(int elapsed)>;
  using DoneFn = std::function<void()>;

  virtual ~Scheduler() = default;

  // tick(0)을 곧바로 예약하고 이후 한 단위마다 tick을 호출한다.
  // tick이 true를 반환하면 on_done이 정확히 한 번 호출된다.
  virtual std::shared_ptr<ScheduledTimer> Start(TickFn tick, DoneFn on_done) = 0;
};

}  // namespace doodle
