#pragma once

#include <cstddef>
#include <utility>

#include "blockingconcurrentqueue.h"
#include "verikit/api/status.hpp"
#include "verikit/task/task_executor.hpp"

namespace verikit {
namespace task {

// One message per finished task, posted by a worker.
struct TaskCompletion {
  std::size_t slot = 0;
  ExecutionReport report;
};

// Many-producer / single-consumer channel from workers to the scheduler loop.
class CompletionChannel {
 public:
  CompletionChannel() {}

  api::Status Post(TaskCompletion&& completion) {
    if (!queue_.enqueue(std::move(completion))) {
      return api::Status::FromModule(api::StatusCode::kInternalError,
                                     "completion queue allocation failed",
                                     api::ErrorModule::kSched);
    }
    return api::Status::Ok();
  }

  // Blocks until a completion is available.
  void Wait(TaskCompletion* out) { queue_.wait_dequeue(*out); }

 private:
  moodycamel::BlockingConcurrentQueue<TaskCompletion> queue_;
};

}  // namespace task
}  // namespace verikit
