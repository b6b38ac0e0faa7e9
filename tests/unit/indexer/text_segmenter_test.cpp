#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>
#include <string>

#include "tome_core/indexer/indexer_error.hpp"
#include "tome_core/indexer/text_segmenter.hpp"
#include "utilities_test.hpp"

namespace tome_tests {

using namespace tome_core;
using ::testing::Contains;

namespace {

// "w0 w1 w2 ..." so that every position in the text is unique.
std::string create_numbered_words(size_t length) {
  std::string content;
  for (size_t i = 0; content.size() < length; ++i) {
    if (!content.empty()) {
      content += ' ';
    }
    content += "w" + std::to_string(i);
  }
  return content;
}

}  // namespace

class TextSegmenterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestUtilities::create_small_config();
  }

  std::vector<Chunk> segment(const std::string& text, int start_index = 0) {
    TextSegmenter segmenter = TestUtilities::create_segmenter(config_);
    SegmentInput input;
    input.text = text;
    input.page_number = 4;
    input.source_id = "mordheim";
    return segmenter.segment(input, start_index);
  }

  ChunkingConfig config_;
};

TEST_F(TextSegmenterTest, ShortSpanBecomesOneTrimmedChunk) {
  TextSegmenter segmenter = TestUtilities::create_segmenter(config_);
  SegmentInput input;
  input.text = "  \nRoll 1d6 on the injury table.\n\n ";
  input.page_number = 12;
  input.section_path = {"INJURIES"};
  input.section_id = "section-1";
  input.source_id = "necromunda";

  auto chunks = segmenter.segment(input, 7);

  ASSERT_EQ(chunks.size(), 1u);
  const Chunk& chunk = chunks[0];
  EXPECT_EQ(chunk.text, "Roll 1d6 on the injury table.");
  EXPECT_EQ(chunk.order_index, 7);
  EXPECT_EQ(chunk.page_start, 12);
  EXPECT_EQ(chunk.page_end, 12);
  EXPECT_EQ(chunk.source_id, "necromunda");
  EXPECT_EQ(chunk.section_id, std::optional<std::string>("section-1"));
  EXPECT_EQ(chunk.section_path, std::vector<std::string>{"INJURIES"});
  EXPECT_THAT(chunk.keywords, Contains("injury"));
  EXPECT_THAT(chunk.keywords, Contains("table"));
  EXPECT_EQ(chunk.score_hints.has_dice_notation, std::optional<bool>(true));
}

TEST_F(TextSegmenterTest, WhitespaceOnlySpanProducesNoChunks) {
  EXPECT_TRUE(segment("   \n\n\t  ").empty());
  EXPECT_TRUE(segment("").empty());
}

TEST_F(TextSegmenterTest, LongSpanWithoutBlankLinesSplitsOnWordsWithOverlap) {
  const std::string text = create_numbered_words(5000);

  auto chunks = segment(text);

  ASSERT_GT(chunks.size(), 1u);
  TestUtilities::expect_contiguous_order(chunks);
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.text.size(), config_.max_size);
    EXPECT_NE(text.find(chunk.text), std::string::npos);
  }
  EXPECT_EQ(text.rfind(chunks.back().text), text.size() - chunks.back().text.size());
  EXPECT_EQ(text.find(chunks.front().text), 0u);

  for (size_t i = 1; i < chunks.size(); ++i) {
    const std::string& earlier = chunks[i - 1].text;
    const std::string& later = chunks[i].text;
    const size_t head_pos = earlier.rfind(later.substr(0, 100));
    ASSERT_NE(head_pos, std::string::npos) << "Chunk " << i << " does not overlap its predecessor";
    EXPECT_GE(head_pos + config_.overlap_size, earlier.size() - 1);
    // One byte of the overlap may be the separating space, which is trimmed.
    EXPECT_GE(TestUtilities::shared_prefix_run(earlier, later), config_.overlap_size - 1);
  }
}

TEST_F(TextSegmenterTest, PrefersParagraphBreakClosestToTarget) {
  const std::string text = TestUtilities::create_paragraphs(10, 450);

  auto chunks = segment(text);

  ASSERT_GT(chunks.size(), 1u);
  const std::string expected_first = TestUtilities::create_words_of_size(450, "para0") + "\n\n" +
                                     TestUtilities::create_words_of_size(450, "para1");
  EXPECT_EQ(chunks[0].text, expected_first);
  EXPECT_TRUE(chunks.back().text.ends_with(text.substr(text.size() - 20)));
  TestUtilities::expect_contiguous_order(chunks);
}

TEST_F(TextSegmenterTest, IndivisibleTokenIsKeptWhole) {
  const std::string token(3000, 'A');

  auto chunks = segment(token);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text.size(), 3000u);
}

TEST_F(TextSegmenterTest, LongTokenAfterWordsEndsChunkOnLastWordBeforeIt) {
  config_ = ChunkingConfig{};
  std::string text;
  for (int i = 0; i < 338; ++i) {
    text += "roll ";
  }
  text += std::string(1500, '_') + " " + TestUtilities::create_words_of_size(3000, "dice");

  auto chunks = segment(text);

  ASSERT_GT(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text.size(), 1689u);
  EXPECT_EQ(chunks[0].text.find('_'), std::string::npos);
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.text.size(), config_.max_size);
  }
}

TEST_F(TextSegmenterTest, ForwardProgressGuardSkipsOverlapWhenItWouldStall) {
  config_.target_size = 500;
  config_.min_size = 200;
  config_.max_size = 1000;
  config_.overlap_size = 150;
  config_.word_boundary_window = 400;
  // The only whitespace sits 110 bytes in, closer than the overlap.
  const std::string text = std::string(110, 'x') + " " + std::string(1000, 'y');

  auto chunks = segment(text);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, std::string(110, 'x'));
  EXPECT_EQ(chunks[1].text, std::string(1000, 'y'));
}

TEST_F(TextSegmenterTest, OverlapNeverStartsInsideAMultibyteCharacter) {
  std::string text;
  while (text.size() < 4000) {
    text += "\xC3\xA9\xC3\xA9\xC3\xA9 ";  // "ééé "
  }

  auto chunks = segment(text);

  ASSERT_GT(chunks.size(), 1u);
  for (const auto& chunk : chunks) {
    ASSERT_FALSE(chunk.text.empty());
    EXPECT_NE(static_cast<unsigned char>(chunk.text.front()) & 0xC0, 0x80);
  }
}

TEST_F(TextSegmenterTest, OrderIndexContinuesFromStartIndex) {
  auto chunks = segment(create_numbered_words(3000), 5);

  ASSERT_GT(chunks.size(), 1u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].order_index, static_cast<int>(5 + i));
    EXPECT_EQ(chunks[i].page_start, 4);
    EXPECT_FALSE(chunks[i].section_id.has_value());
  }
}

TEST_F(TextSegmenterTest, ConstructorRejectsInvalidConfigAndMissingCollaborators) {
  ChunkingConfig bad = config_;
  bad.min_size = bad.target_size;
  EXPECT_THROW(TestUtilities::create_segmenter(bad), IndexerError);

  EXPECT_THROW(TextSegmenter(config_, nullptr, std::make_shared<const ScoreHintAnalyzer>()),
               IndexerError);
  EXPECT_THROW(TextSegmenter(config_, std::make_shared<const KeywordExtractor>(), nullptr),
               IndexerError);
}

}  // namespace tome_tests
