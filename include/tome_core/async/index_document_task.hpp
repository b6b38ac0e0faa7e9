#pragma once

#include <future>

#include "tome_core/async/ITask.hpp"
#include "tome_core/indexer/indexing_pipeline.hpp"
#include "tome_core/types/page.hpp"

namespace tome_core {
class IndexDocumentTask : public ITask {
public:
    explicit IndexDocumentTask(SourceDocument document);

    void execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
    void on_failed(std::exception_ptr error) override;
    const char* get_type() const override { return "INDEX_DOCUMENT"; }
    std::string get_target() const override { return document_.source_id; }

    // Fulfilled when the task completes or fails. May be called once.
    std::future<IndexingResult> get_future();

    const SourceDocument& get_document() const { return document_; }

private:
    SourceDocument document_;
    std::promise<IndexingResult> result_;
};
}  // namespace tome_core
