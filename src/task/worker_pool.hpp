#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "verikit/api/status.hpp"

namespace verikit {
namespace task {

struct WorkerPoolStats {
  std::uint64_t submitted = 0;
  std::uint64_t completed = 0;
  std::size_t busy_high_watermark = 0;
};

// Fixed set of worker threads draining a FIFO of jobs. Destruction stops
// accepting work, lets queued and running jobs finish, then joins.
// Construction throws std::system_error when a worker thread cannot start.
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t worker_count);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  api::Status Submit(std::function<void()> job);

  std::size_t worker_count() const { return workers_.size(); }
  WorkerPoolStats Stats() const;

  // 0 -> hardware concurrency (at least 1).
  static std::size_t NormalizeWorkerCount(std::size_t worker_count);

 private:
  void WorkerLoop();
  void StopAndJoin();

  std::vector<std::thread> workers_;
  std::deque<std::function<void()> > jobs_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_;
  std::size_t busy_;
  WorkerPoolStats stats_;
};

}  // namespace task
}  // namespace verikit
