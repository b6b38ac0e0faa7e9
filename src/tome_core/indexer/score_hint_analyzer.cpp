#include "tome_core/indexer/score_hint_analyzer.hpp"

#include <algorithm>
#include <regex>

#include "tome_core/utils/text_utils.hpp"

namespace tome_core {

namespace {

// More than this many matching lines makes a table or list.
constexpr long kMinStructuredLines = 3;

constexpr const char* kEnDash = "\xE2\x80\x93";
constexpr const char* kBullet = "\xE2\x80\xA2";

const std::regex& roll_range_regex() {
  static const std::regex re(std::string(R"(\b[1-6]\s*(?:-|)") + kEnDash + R"()\s*[1-6]\b)");
  return re;
}

const std::regex& roll_die_regex() {
  static const std::regex re(R"(\b(?:D6|d6|D66|d66)\b)");
  return re;
}

const std::regex& numbered_row_regex() {
  static const std::regex re(R"(^\s*\d+\.?\s)");
  return re;
}

const std::regex& bullet_line_regex() {
  static const std::regex re(std::string(R"(^\s*(?:-|\*|)") + kBullet + R"()\s)");
  return re;
}

const std::regex& numbered_list_regex() {
  static const std::regex re(R"(^\s*\d+[.)]\s)");
  return re;
}

const std::regex& dice_regex() {
  static const std::regex re(R"(\b\d*[dD]\d+(?:\+\d+)?\b)");
  return re;
}

bool search(std::string_view text, const std::regex& re) {
  return std::regex_search(text.begin(), text.end(), re);
}

long count_lines(const std::vector<std::string_view>& lines,
                 const std::function<bool(std::string_view)>& predicate) {
  return std::count_if(lines.begin(), lines.end(), predicate);
}

}  // namespace

std::string to_string(ScoreHint hint) {
  switch (hint) {
    case ScoreHint::RollRanges:
      return "hasRollRanges";
    case ScoreHint::TablePattern:
      return "hasTablePattern";
    case ScoreHint::ListPattern:
      return "hasListPattern";
    case ScoreHint::DiceNotation:
      return "hasDiceNotation";
  }
  return "unknown";
}

namespace hint_detectors {

bool has_roll_ranges(const HintInput& input) {
  return search(input.text, roll_range_regex()) || search(input.text, roll_die_regex());
}

bool has_table_pattern(const HintInput& input) {
  const bool has_tabs = std::any_of(input.lines.begin(), input.lines.end(), [](std::string_view line) {
    return line.find('\t') != std::string_view::npos;
  });
  if (has_tabs) {
    return true;
  }
  return count_lines(input.lines, [](std::string_view line) {
           return search(line, numbered_row_regex());
         }) > kMinStructuredLines;
}

bool has_list_pattern(const HintInput& input) {
  return count_lines(input.lines, [](std::string_view line) {
           return search(line, bullet_line_regex()) || search(line, numbered_list_regex());
         }) > kMinStructuredLines;
}

bool has_dice_notation(const HintInput& input) {
  return search(input.text, dice_regex());
}

}  // namespace hint_detectors

ScoreHintAnalyzer::ScoreHintAnalyzer() : detectors_(default_detectors()) {}

ScoreHintAnalyzer::ScoreHintAnalyzer(std::vector<HintDetector> detectors)
    : detectors_(std::move(detectors)) {}

std::vector<HintDetector> ScoreHintAnalyzer::default_detectors() {
  return {
      {ScoreHint::RollRanges, hint_detectors::has_roll_ranges},
      {ScoreHint::TablePattern, hint_detectors::has_table_pattern},
      {ScoreHint::ListPattern, hint_detectors::has_list_pattern},
      {ScoreHint::DiceNotation, hint_detectors::has_dice_notation},
  };
}

ScoreHints ScoreHintAnalyzer::analyze(std::string_view text) const {
  HintInput input{text, {}};
  for (auto line : text_utils::split_lines(text)) {
    if (!text_utils::trim_view(line).empty()) {
      input.lines.push_back(line);
    }
  }

  ScoreHints hints;
  for (const auto& detector : detectors_) {
    if (!detector.detect(input)) {
      continue;
    }
    switch (detector.hint) {
      case ScoreHint::RollRanges:
        hints.has_roll_ranges = true;
        break;
      case ScoreHint::TablePattern:
        hints.has_table_pattern = true;
        break;
      case ScoreHint::ListPattern:
        hints.has_list_pattern = true;
        break;
      case ScoreHint::DiceNotation:
        hints.has_dice_notation = true;
        break;
    }
  }
  return hints;
}

}  // namespace tome_core
