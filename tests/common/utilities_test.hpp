#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "tome_core/indexer/chunking_config.hpp"
#include "tome_core/indexer/indexing_pipeline.hpp"
#include "tome_core/indexer/text_segmenter.hpp"
#include "tome_core/types/chunk.hpp"
#include "tome_core/types/page.hpp"

namespace tome_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Words separated by single spaces, cut to exactly `length` bytes.
  static std::string create_words_of_size(size_t length, const std::string& word = "lorem");

  // Paragraphs of roughly `paragraph_size` bytes joined by blank lines.
  static std::string create_paragraphs(size_t count, size_t paragraph_size);

  // One page per text, numbered from first_page.
  static std::vector<tome_core::PageText> create_pages(const std::vector<std::string>& texts,
                                                       int first_page = 1);

  // The 1000/400/1500/150 sizes used by the long-span scenarios.
  static tome_core::ChunkingConfig create_small_config();

  static tome_core::TextSegmenter create_segmenter(
      const tome_core::ChunkingConfig& config = tome_core::ChunkingConfig{});

  // Field-by-field comparison of two pipeline results.
  static void expect_same_result(const tome_core::IndexingResult& expected,
                                 const tome_core::IndexingResult& actual);

  // order_index must run 0..n-1.
  static void expect_contiguous_order(const std::vector<tome_core::Chunk>& chunks);

  // Length of the longest suffix of `earlier` that is also a prefix of `later`,
  // or of any shared substring taken from the start of `later`.
  static size_t shared_prefix_run(const std::string& earlier, const std::string& later);
};

}  // namespace tome_tests
