/*
 * 설명: steady_timer 위에 세대 플래그를 두어 취소된 대기가 늦게 실행되지 않도록 한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/typing_tracker_test.cpp
 */
#include "presence/cancellable_timer.hpp"

namespace presence {

CancellableTimer::CancellableTimer(const LoopExecutor& executor) : timer_(executor) {}

CancellableTimer::~CancellableTimer() { Cancel(); }

void CancellableTimer::Start(std::chrono::milliseconds delay, Handler handler) {
  Cancel();
  handler_ = std::move(handler);
  auto armed = std::make_shared<std::atomic<bool>>(true);
  armed_ = armed;
  timer_.expires_after(delay);
  // 핸들러 사본을 잡아 두므로 타이머 객체가 먼저 사라져도 안전하다.
  timer_.async_wait([armed, handler = handler_](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    bool expected = true;
    if (!armed->compare_exchange_strong(expected, false)) {
      return;
    }
    if (handler) {
      handler();
    }
  });
}

void CancellableTimer::Reset(std::chrono::milliseconds delay) {
  if (!handler_) {
    return;
  }
  Start(delay, handler_);
}

void CancellableTimer::Cancel() {
  if (armed_) {
    armed_->store(false);
    armed_.reset();
  }
  timer_.cancel();
}

}  // namespace presence
