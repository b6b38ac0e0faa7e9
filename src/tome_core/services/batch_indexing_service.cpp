#include "tome_core/services/batch_indexing_service.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>

#include "tome_core/async/index_document_task.hpp"
#include "tome_core/async/service_provider.hpp"
#include "tome_core/async/task_queue.hpp"
#include "tome_core/async/worker_pool.hpp"

namespace tome_core {

BatchIndexingService::BatchIndexingService(std::shared_ptr<const IndexingPipeline> pipeline,
                                           size_t num_workers)
    : pipeline_(std::move(pipeline)), num_workers_(num_workers) {
  if (!pipeline_) {
    throw std::invalid_argument("BatchIndexingService requires a pipeline.");
  }
  if (num_workers_ == 0) {
    throw std::invalid_argument("BatchIndexingService needs at least one worker.");
  }
}

std::vector<IndexingOutcome> BatchIndexingService::index_all(std::vector<SourceDocument> documents) {
  std::vector<IndexingOutcome> outcomes;
  if (documents.empty()) {
    return outcomes;
  }

  auto task_queue = std::make_shared<TaskQueue>();
  auto services = std::make_shared<ServiceProvider>(task_queue, pipeline_);

  std::vector<std::string> source_ids;
  std::vector<std::future<IndexingResult>> futures;
  source_ids.reserve(documents.size());
  futures.reserve(documents.size());

  for (auto& document : documents) {
    source_ids.push_back(document.source_id);
    auto task = std::make_unique<IndexDocumentTask>(std::move(document));
    futures.push_back(task->get_future());
    task_queue->enqueue(std::move(task));
  }

  {
    async::WorkerPool pool(std::min(num_workers_, futures.size()), services);
    pool.start();

    outcomes.reserve(futures.size());
    for (size_t i = 0; i < futures.size(); ++i) {
      IndexingOutcome outcome;
      outcome.source_id = source_ids[i];
      try {
        outcome.result = futures[i].get();
      } catch (const std::exception& e) {
        outcome.error = e.what();
      }
      outcomes.push_back(std::move(outcome));
    }
    pool.stop();
  }

  const size_t failed = std::count_if(outcomes.begin(), outcomes.end(),
                                      [](const IndexingOutcome& o) { return !o.succeeded(); });
  std::cout << "Batch indexed " << outcomes.size() - failed << " of " << outcomes.size()
            << " documents." << std::endl;

  last_task_queue_ = task_queue;
  return outcomes;
}

IndexingOutcome BatchIndexingService::index_one(const SourceDocument& document) const {
  IndexingOutcome outcome;
  outcome.source_id = document.source_id;
  try {
    outcome.result = pipeline_->run(document);
  } catch (const std::exception& e) {
    std::cerr << "Failed to index " << document.source_id << ": " << e.what() << std::endl;
    outcome.error = e.what();
  }
  return outcome;
}

}  // namespace tome_core
