#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

#include "verikit/api/export.hpp"

namespace verikit {
namespace task {

// One-shot cancellation flag shared between the executor and a Verifier.
class VERIKIT_API CancellationToken {
 public:
  CancellationToken() : cancelled_(false) {}

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();
  bool IsCancelled() const;

  // Blocks up to `timeout`; returns true as soon as the token is cancelled.
  bool WaitFor(std::chrono::milliseconds timeout) const;

 private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  bool cancelled_;
};

}  // namespace task
}  // namespace verikit
