#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace agentflow {

// Copyable handle to a shared cancel flag. Copies observe the same flag.
class CancellationToken {
 public:
  CancellationToken();

  // Copies share the flag, so cancelling through a const handle is allowed
  void cancel() const;

  bool cancelled() const;

  // Sleep until `timeout` elapses or the token is cancelled.
  // Returns true if the token was cancelled.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled.load(); });
  }

 private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
  };

  std::shared_ptr<State> state_;
};

}  // namespace agentflow
