#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tome_core/types/page.hpp"
#include "tome_core/types/section.hpp"

namespace tome_core {

// What a header rule sees of a candidate line.
struct HeaderCandidate {
  // The line with surrounding whitespace removed.
  std::string_view trimmed;
  // The following line of the document (across page breaks), trimmed; absent at the end.
  std::optional<std::string_view> next_trimmed;
};

/**
 * @brief One header heuristic: returns the header level when the line matches.
 */
struct HeaderRule {
  std::string name;
  std::function<std::optional<int>(const HeaderCandidate&)> classify;
};

struct HeaderMatch {
  int level = 1;
  std::string rule;
};

// A detected header line and its position in the flattened document.
struct DetectedHeader {
  std::string title;
  int level = 1;
  std::string rule;
  size_t line_position = 0;
  int page_number = 1;
  size_t line_index = 0;
};

/**
 * @class SectionExtractor
 * @brief Recovers a flat outline from unmarked page text.
 *
 * Lines are classified by an ordered table of HeaderRules, first match wins.
 * Each detected header owns the lines up to the next header, across page
 * boundaries.
 */
class SectionExtractor {
 public:
  static constexpr size_t MIN_HEADER_LENGTH = 3;
  static constexpr size_t MAX_HEADER_LENGTH = 80;

  // Uses default_rules().
  SectionExtractor();
  explicit SectionExtractor(std::vector<HeaderRule> rules);

  // all-caps, numbered heading, title case before a blank line.
  static std::vector<HeaderRule> default_rules();

  // Classifies one line; std::nullopt for non-headers and for lines outside
  // [MIN_HEADER_LENGTH, MAX_HEADER_LENGTH].
  std::optional<HeaderMatch> classify(const HeaderCandidate& candidate) const;

  std::vector<DetectedHeader> detect_headers(const std::vector<PageText>& pages) const;

  std::vector<Section> extract(const std::vector<PageText>& pages,
                               const std::string& source_id) const;

  const std::vector<HeaderRule>& rules() const {
    return rules_;
  }

 private:
  std::vector<HeaderRule> rules_;
};

// The default heuristics, exposed for testing.
namespace header_rules {
std::optional<int> all_caps(const HeaderCandidate& candidate);
std::optional<int> numbered_heading(const HeaderCandidate& candidate);
std::optional<int> title_case_before_blank(const HeaderCandidate& candidate);
}  // namespace header_rules

/**
 * @brief Deterministic id for a section, used as the chunks' back-reference.
 */
std::string make_section_id(const std::string& source_id, size_t ordinal, const std::string& title);

}  // namespace tome_core
