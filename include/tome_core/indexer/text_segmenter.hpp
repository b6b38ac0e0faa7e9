#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tome_core/indexer/chunking_config.hpp"
#include "tome_core/indexer/keyword_extractor.hpp"
#include "tome_core/indexer/score_hint_analyzer.hpp"
#include "tome_core/types/chunk.hpp"

namespace tome_core {

// One logical span to be chunked: a section body or a whole page.
struct SegmentInput {
  std::string_view text;
  int page_number = 1;
  std::vector<std::string> section_path;
  std::optional<std::string> section_id;
  std::string source_id;
};

/**
 * @class TextSegmenter
 * @brief Splits a span into overlapping, size-bounded, annotated chunks.
 *
 * Paragraph breaks are preferred split points. When none falls inside the
 * allowed window the split moves to the whitespace nearest the target size,
 * and when there is no whitespace nearby the unbroken token is kept whole.
 * Consecutive chunks share overlap_size bytes of text.
 *
 * The segmenter holds no mutable state and may be shared between threads.
 */
class TextSegmenter {
 public:
  TextSegmenter(ChunkingConfig config,
                std::shared_ptr<const KeywordExtractor> keyword_extractor,
                std::shared_ptr<const ScoreHintAnalyzer> hint_analyzer);

  /**
   * @brief Chunks a single span.
   * @param input The span and the provenance copied onto every chunk.
   * @param start_index order_index given to the first emitted chunk.
   * @return Chunks with consecutive order_index values starting at start_index.
   */
  std::vector<Chunk> segment(const SegmentInput& input, int start_index) const;

  const ChunkingConfig& config() const {
    return config_;
  }

 private:
  // End offset of the chunk starting at current_start.
  size_t choose_break(std::string_view text, const std::vector<size_t>& break_points,
                      size_t current_start) const;

  Chunk make_chunk(const SegmentInput& input, std::string text, int order_index) const;

  ChunkingConfig config_;
  std::shared_ptr<const KeywordExtractor> keyword_extractor_;
  std::shared_ptr<const ScoreHintAnalyzer> hint_analyzer_;
};

}  // namespace tome_core
