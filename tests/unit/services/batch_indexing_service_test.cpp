#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "tome_core/async/task_queue.hpp"
#include "tome_core/services/batch_indexing_service.hpp"
#include "utilities_test.hpp"

namespace tome_tests {

using namespace tome_core;

class BatchIndexingServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    pipeline_ = std::make_shared<const IndexingPipeline>(TestUtilities::create_small_config());
  }

  static std::vector<SourceDocument> create_documents(size_t count) {
    std::vector<SourceDocument> documents;
    for (size_t i = 0; i < count; ++i) {
      std::vector<std::string> pages;
      if (i % 2 == 0) {
        pages.push_back("WARBAND CREATION\n\n" + TestUtilities::create_paragraphs(4 + i, 300));
        pages.push_back("EQUIPMENT\n- Sword\n- Axe\n- Spear\n- Bow\n- Shield");
      } else {
        pages.push_back("Roll 2D6 for each model. " + TestUtilities::create_words_of_size(2500 + 100 * i));
      }
      documents.push_back({"doc-" + std::to_string(i), TestUtilities::create_pages(pages)});
    }
    return documents;
  }

  std::shared_ptr<const IndexingPipeline> pipeline_;
};

TEST_F(BatchIndexingServiceTest, ConcurrentBatchMatchesSequentialRuns) {
  auto documents = create_documents(8);
  BatchIndexingService service(pipeline_, 4);

  auto concurrent = service.index_all(documents);

  ASSERT_EQ(concurrent.size(), documents.size());
  for (size_t i = 0; i < documents.size(); ++i) {
    auto sequential = service.index_one(documents[i]);
    ASSERT_TRUE(concurrent[i].succeeded()) << *concurrent[i].error;
    ASSERT_TRUE(sequential.succeeded());
    EXPECT_EQ(concurrent[i].source_id, documents[i].source_id);
    TestUtilities::expect_same_result(*sequential.result, *concurrent[i].result);
  }
}

TEST_F(BatchIndexingServiceTest, TwoDocumentsIndexedConcurrentlyDoNotInterfere) {
  std::vector<SourceDocument> documents = {
      {"mordheim", TestUtilities::create_pages({"COMBAT\n\nRoll to hit."})},
      {"necromunda", TestUtilities::create_pages({"Combat Rules. Roll 1d6 to hit."})},
  };
  BatchIndexingService service(pipeline_, 2);

  auto outcomes = service.index_all(documents);

  ASSERT_EQ(outcomes.size(), 2u);
  TestUtilities::expect_same_result(pipeline_->run(documents[0]), *outcomes[0].result);
  TestUtilities::expect_same_result(pipeline_->run(documents[1]), *outcomes[1].result);
  EXPECT_EQ(outcomes[0].result->sections.size(), 1u);
  EXPECT_TRUE(outcomes[1].result->sections.empty());
}

TEST_F(BatchIndexingServiceTest, FailingDocumentDoesNotAffectOthers) {
  auto documents = create_documents(3);
  documents[1].pages = {{"Second.", 2}, {"First.", 1}};
  BatchIndexingService service(pipeline_, 2);

  auto outcomes = service.index_all(documents);

  ASSERT_EQ(outcomes.size(), 3u);
  EXPECT_TRUE(outcomes[0].succeeded());
  EXPECT_FALSE(outcomes[1].succeeded());
  ASSERT_TRUE(outcomes[1].error.has_value());
  EXPECT_NE(outcomes[1].error->find("out of order"), std::string::npos);
  EXPECT_TRUE(outcomes[2].succeeded());

  auto queue = service.last_task_queue();
  ASSERT_NE(queue, nullptr);
  auto failed = queue->get_tasks_by_status(TaskStatus::FAILED);
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].target, "doc-1");
  EXPECT_EQ(queue->get_tasks_by_status(TaskStatus::COMPLETED).size(), 2u);
}

TEST_F(BatchIndexingServiceTest, IndexOneReportsErrorsInOutcome) {
  BatchIndexingService service(pipeline_, 1);

  auto outcome = service.index_one({"bad", {{"Zero.", 0}}});

  EXPECT_FALSE(outcome.succeeded());
  EXPECT_EQ(outcome.source_id, "bad");
  EXPECT_TRUE(outcome.error.has_value());
}

TEST_F(BatchIndexingServiceTest, MoreWorkersThanDocuments) {
  BatchIndexingService service(pipeline_, 16);

  auto outcomes = service.index_all(create_documents(2));

  ASSERT_EQ(outcomes.size(), 2u);
  EXPECT_TRUE(outcomes[0].succeeded());
  EXPECT_TRUE(outcomes[1].succeeded());
}

TEST_F(BatchIndexingServiceTest, EmptyBatchYieldsNoOutcomes) {
  BatchIndexingService service(pipeline_, 2);

  EXPECT_TRUE(service.index_all({}).empty());
}

TEST_F(BatchIndexingServiceTest, ConstructorValidatesArguments) {
  EXPECT_THROW(BatchIndexingService(nullptr, 2), std::invalid_argument);
  EXPECT_THROW(BatchIndexingService(pipeline_, 0), std::invalid_argument);
}

}  // namespace tome_tests
