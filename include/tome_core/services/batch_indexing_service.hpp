#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tome_core/indexer/indexing_pipeline.hpp"
#include "tome_core/types/page.hpp"

namespace tome_core {

class TaskQueue;

// The result of one document in a batch. A failed document has no result and
// counts as having produced zero chunks.
struct IndexingOutcome {
  std::string source_id;
  std::optional<IndexingResult> result;
  std::optional<std::string> error;

  bool succeeded() const {
    return result.has_value();
  }
};

/**
 * @class BatchIndexingService
 * @brief Indexes many independent source documents on a worker pool.
 *
 * Every document becomes one task; tasks never share mutable state, so the
 * outcome of a batch equals running the documents one after another.
 */
class BatchIndexingService {
 public:
  /**
   * @param pipeline The read-only pipeline shared by every worker.
   * @param num_workers Threads used by index_all(); must be at least 1.
   */
  BatchIndexingService(std::shared_ptr<const IndexingPipeline> pipeline, size_t num_workers);

  /**
   * @brief Indexes all documents concurrently.
   * @return One outcome per document, in input order.
   */
  std::vector<IndexingOutcome> index_all(std::vector<SourceDocument> documents);

  // Indexes one document on the calling thread.
  IndexingOutcome index_one(const SourceDocument& document) const;

  // Status records of the tasks run by the last index_all() call.
  std::shared_ptr<const TaskQueue> last_task_queue() const {
    return last_task_queue_;
  }

 private:
  std::shared_ptr<const IndexingPipeline> pipeline_;
  size_t num_workers_;
  std::shared_ptr<const TaskQueue> last_task_queue_;
};

}  // namespace tome_core
