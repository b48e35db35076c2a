#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "presence/api_response.hpp"
#include "presence/channel.hpp"

namespace presence_test {

// 보낸 프레임을 그대로 기록하는 테스트용 채널. accept_limit 이후의 Send는 실패한다.
class RecordingChannel : public presence::Channel {
 public:
  bool Send(const presence::WsEnvelope& envelope) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_ || (accept_limit_ >= 0 && static_cast<long>(frames_.size()) >= accept_limit_)) {
      return false;
    }
    frames_.push_back(presence::ToWsJson(envelope));
    return true;
  }

  bool IsOpen() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
  }

  void Close(const std::string& reason) override {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    close_reason_ = reason;
  }

  void SetAcceptLimit(long limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    accept_limit_ = limit;
  }

  std::vector<nlohmann::json> Frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_;
  }

  std::vector<nlohmann::json> Events(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> result;
    for (const auto& frame : frames_) {
      if (frame["t"] == "event" && frame["event"] == name) {
        result.push_back(frame);
      }
    }
    return result;
  }

  std::size_t Count(const std::string& name) const { return Events(name).size(); }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
  }

  std::string CloseReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<nlohmann::json> frames_;
  bool open_{true};
  long accept_limit_{-1};
  std::string close_reason_;
};

}  // namespace presence_test
