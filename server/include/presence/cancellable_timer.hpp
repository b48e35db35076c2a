/*
 * 설명: 시작/재시작/취소가 가능한 단발 타이머. 취소되거나 교체된 타이머는 핸들러를 호출하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/typing_tracker_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace presence {

// 모든 핸들러와 타이머 콜백이 실행되는 이벤트 루프 실행기.
using LoopExecutor = boost::asio::strand<boost::asio::io_context::executor_type>;

class CancellableTimer {
 public:
  using Handler = std::function<void()>;

  explicit CancellableTimer(const LoopExecutor& executor);
  ~CancellableTimer();

  CancellableTimer(const CancellableTimer&) = delete;
  CancellableTimer& operator=(const CancellableTimer&) = delete;

  void Start(std::chrono::milliseconds delay, Handler handler);
  void Reset(std::chrono::milliseconds delay);
  void Cancel();
  bool Armed() const { return armed_ && armed_->load(); }

 private:
  boost::asio::steady_timer timer_;
  Handler handler_;
  std::shared_ptr<std::atomic<bool>> armed_;
};

}  // namespace presence
