#include "task/worker_pool.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include <glog/logging.h>

namespace verikit {
namespace task {

#define VK_STATUS(code, message, detail_id) \
  api::Status::FromModule((code), (message), api::ErrorModule::kSched, (detail_id))

std::size_t WorkerPool::NormalizeWorkerCount(std::size_t worker_count) {
  if (worker_count > 0) return worker_count;
  const std::size_t hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
  return hw == 0 ? 1 : hw;
}

WorkerPool::WorkerPool(std::size_t worker_count) : stopping_(false), busy_(0) {
  const std::size_t count = NormalizeWorkerCount(worker_count);
  workers_.reserve(count);
  try {
    for (std::size_t i = 0; i < count; ++i) {
      workers_.push_back(std::thread(&WorkerPool::WorkerLoop, this));
    }
  } catch (const std::system_error& ex) {
    LOG(ERROR) << "started " << workers_.size() << " of " << count << " workers: " << ex.what();
    StopAndJoin();
    throw;
  }
}

WorkerPool::~WorkerPool() { StopAndJoin(); }

void WorkerPool::StopAndJoin() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    if (workers_[i].joinable()) workers_[i].join();
  }
}

api::Status WorkerPool::Submit(std::function<void()> job) {
  if (!job) {
    return VK_STATUS(api::StatusCode::kInvalidArgument, "job is empty", api::detail::kNone);
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) {
      return VK_STATUS(api::StatusCode::kWouldBlock, "worker pool is stopping",
                       api::detail::kSchedSubmitRejected);
    }
    jobs_.push_back(std::move(job));
    ++stats_.submitted;
  }
  cv_.notify_one();
  return api::Status::Ok();
}

WorkerPoolStats WorkerPool::Stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

void WorkerPool::WorkerLoop() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
      ++busy_;
      if (busy_ > stats_.busy_high_watermark) stats_.busy_high_watermark = busy_;
    }

    try {
      job();
    } catch (const std::exception& ex) {
      LOG(ERROR) << "worker job threw: " << ex.what();
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      --busy_;
      ++stats_.completed;
    }
  }
}

#undef VK_STATUS

}  // namespace task
}  // namespace verikit
