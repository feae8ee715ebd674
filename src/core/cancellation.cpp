#include "agentflow/core/cancellation.hpp"

namespace agentflow {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() const {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled.store(true);
  }
  state_->cv.notify_all();
}

bool CancellationToken::cancelled() const {
  return state_->cancelled.load();
}

}  // namespace agentflow
