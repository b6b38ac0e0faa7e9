#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "tome_core/types/chunk.hpp"

namespace tome_core {

enum class ScoreHint { RollRanges, TablePattern, ListPattern, DiceNotation };

std::string to_string(ScoreHint hint);

// Text of a span together with its non-blank lines, shared by all detectors.
struct HintInput {
  std::string_view text;
  std::vector<std::string_view> lines;
};

struct HintDetector {
  ScoreHint hint;
  std::function<bool(const HintInput&)> detect;
};

/**
 * @class ScoreHintAnalyzer
 * @brief Runs a table of independent detectors over a span of text.
 *
 * Every detector that fires sets its flag to true; flags of detectors that do
 * not fire stay unset.
 */
class ScoreHintAnalyzer {
 public:
  // Uses default_detectors().
  ScoreHintAnalyzer();
  explicit ScoreHintAnalyzer(std::vector<HintDetector> detectors);

  static std::vector<HintDetector> default_detectors();

  ScoreHints analyze(std::string_view text) const;

  const std::vector<HintDetector>& detectors() const {
    return detectors_;
  }

 private:
  std::vector<HintDetector> detectors_;
};

// The individual detectors, exposed for testing.
namespace hint_detectors {
bool has_roll_ranges(const HintInput& input);
bool has_table_pattern(const HintInput& input);
bool has_list_pattern(const HintInput& input);
bool has_dice_notation(const HintInput& input);
}  // namespace hint_detectors

}  // namespace tome_core
