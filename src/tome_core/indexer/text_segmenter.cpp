#include "tome_core/indexer/text_segmenter.hpp"

#include "tome_core/indexer/break_point_finder.hpp"
#include "tome_core/indexer/indexer_error.hpp"
#include "tome_core/utils/text_utils.hpp"

namespace tome_core {

TextSegmenter::TextSegmenter(ChunkingConfig config,
                             std::shared_ptr<const KeywordExtractor> keyword_extractor,
                             std::shared_ptr<const ScoreHintAnalyzer> hint_analyzer)
    : config_(config),
      keyword_extractor_(std::move(keyword_extractor)),
      hint_analyzer_(std::move(hint_analyzer)) {
  config_.validate();
  if (!keyword_extractor_ || !hint_analyzer_) {
    throw IndexerError("TextSegmenter requires a keyword extractor and a hint analyzer");
  }
}

std::vector<Chunk> TextSegmenter::segment(const SegmentInput& input, int start_index) const {
  std::vector<Chunk> chunks;
  const std::string_view text = input.text;

  if (text.size() <= config_.target_size) {
    std::string trimmed = text_utils::trim(text);
    if (!trimmed.empty()) {
      chunks.push_back(make_chunk(input, std::move(trimmed), start_index));
    }
    return chunks;
  }

  const std::vector<size_t> break_points = BreakPointFinder::find_natural_break_points(text);
  int order_index = start_index;
  size_t current_start = 0;

  while (current_start < text.size()) {
    const size_t break_point = choose_break(text, break_points, current_start);

    std::string chunk_text = text_utils::trim(text.substr(current_start, break_point - current_start));
    if (!chunk_text.empty()) {
      chunks.push_back(make_chunk(input, std::move(chunk_text), order_index++));
    }

    if (break_point >= text.size()) {
      break;
    }

    // Step back by the overlap, but never onto a UTF-8 continuation byte.
    size_t next_start = break_point > config_.overlap_size ? break_point - config_.overlap_size : 0;
    next_start = text_utils::align_to_codepoint(text, next_start);
    if (next_start <= current_start) {
      // The overlap would stall the walk; resume right at the break instead.
      next_start = break_point;
    }
    current_start = next_start;
  }

  return chunks;
}

size_t TextSegmenter::choose_break(std::string_view text, const std::vector<size_t>& break_points,
                                   size_t current_start) const {
  const size_t target_end = current_start + config_.target_size;

  if (auto natural = BreakPointFinder::closest_break_between(
          break_points, current_start + config_.min_size, current_start + config_.max_size,
          target_end)) {
    return *natural;
  }

  if (target_end >= text.size()) {
    return text.size();
  }

  if (auto boundary =
          BreakPointFinder::find_word_boundary(text, target_end, config_.word_boundary_window)) {
    return *boundary;
  }

  // A long token covers the window: end on the last word before it.
  if (auto earlier = BreakPointFinder::last_whitespace_before(text, current_start, target_end)) {
    return *earlier;
  }

  // The chunk is a single unbroken token: keep it whole.
  return BreakPointFinder::end_of_token(text, target_end);
}

Chunk TextSegmenter::make_chunk(const SegmentInput& input, std::string text, int order_index) const {
  Chunk chunk;
  chunk.source_id = input.source_id;
  chunk.section_id = input.section_id;
  chunk.page_start = input.page_number;
  chunk.page_end = input.page_number;
  chunk.section_path = input.section_path;
  chunk.order_index = order_index;
  chunk.keywords = keyword_extractor_->extract(text);
  chunk.score_hints = hint_analyzer_->analyze(text);
  chunk.text = std::move(text);
  return chunk;
}

}  // namespace tome_core
