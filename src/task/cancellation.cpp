#include "verikit/task/cancellation.hpp"

namespace verikit {
namespace task {

void CancellationToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cancelled_;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

}  // namespace task
}  // namespace verikit
