#include "tome_core/async/index_document_task.hpp"

#include <string>

#include "tome_core/async/service_provider.hpp"

namespace tome_core {

IndexDocumentTask::IndexDocumentTask(SourceDocument document)
    : ITask(0, TaskStatus::PENDING, std::chrono::system_clock::now(),
            std::chrono::system_clock::now(), std::nullopt),
      document_(std::move(document)) {}

std::future<IndexingResult> IndexDocumentTask::get_future() {
  return result_.get_future();
}

void IndexDocumentTask::execute(ServiceProvider& services, const ProgressUpdater& on_progress) {
  on_progress(0.0f, "Indexing " + std::to_string(document_.pages.size()) + " pages...");

  const IndexingPipeline& pipeline = services.get_pipeline();
  IndexingResult result = pipeline.run(document_);

  on_progress(1.0f, "Produced " + std::to_string(result.sections.size()) + " sections, " +
                        std::to_string(result.chunks.size()) + " chunks and " +
                        std::to_string(result.tables.size()) + " tables.");
  result_.set_value(std::move(result));
}

void IndexDocumentTask::on_failed(std::exception_ptr error) {
  result_.set_exception(error);
}

}  // namespace tome_core
