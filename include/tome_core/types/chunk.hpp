#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tome_core {

// Structural signals for the downstream relevance scorer.
// An unset flag means "not detected".
struct ScoreHints {
  std::optional<bool> has_roll_ranges;
  std::optional<bool> has_table_pattern;
  std::optional<bool> has_list_pattern;
  std::optional<bool> has_dice_notation;

  bool operator==(const ScoreHints&) const = default;
};

struct Chunk {
  std::string source_id;
  std::optional<std::string> section_id;
  std::string text;
  int page_start = 1;
  int page_end = 1;
  std::vector<std::string> section_path;
  int order_index = 0;
  std::vector<std::string> keywords;
  ScoreHints score_hints;
};

}  // namespace tome_core
