#pragma once

#include <memory>

namespace tome_core {
class TaskQueue;
class IndexingPipeline;
}

namespace tome_core {

class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<TaskQueue> queue,
                  std::shared_ptr<const IndexingPipeline> pipeline)
      : task_queue_(queue), pipeline_(pipeline) {}

  TaskQueue& get_task_queue() {
    return *task_queue_;
  }
  const IndexingPipeline& get_pipeline() const {
    return *pipeline_;
  }

 private:
  std::shared_ptr<TaskQueue> task_queue_;
  std::shared_ptr<const IndexingPipeline> pipeline_;
};

}  // namespace tome_core
