#include "tome_core/indexer/break_point_finder.hpp"

#include <algorithm>
#include <regex>

#include "tome_core/utils/text_utils.hpp"

namespace tome_core {

std::vector<size_t> BreakPointFinder::find_natural_break_points(std::string_view text) {
  std::vector<size_t> break_points;
  if (text.empty()) {
    return break_points;
  }

  // One or more blank lines act as paragraph separators.
  static const std::regex paragraph_regex(R"(\n\s*\n)");

  using svregex_iterator = std::regex_iterator<std::string_view::const_iterator>;
  auto begin = svregex_iterator(text.begin(), text.end(), paragraph_regex);
  auto end = svregex_iterator();

  for (auto it = begin; it != end; ++it) {
    // Split *after* the blank lines.
    break_points.push_back(static_cast<size_t>(it->position() + it->length()));
  }
  return break_points;
}

std::optional<size_t> BreakPointFinder::closest_break_between(
    const std::vector<size_t>& break_points, size_t lower, size_t upper, size_t target) {
  std::optional<size_t> best;
  size_t best_distance = 0;
  for (size_t bp : break_points) {
    if (bp <= lower) {
      continue;
    }
    if (bp >= upper) {
      break;
    }
    const size_t distance = bp > target ? bp - target : target - bp;
    if (!best || distance < best_distance) {
      best = bp;
      best_distance = distance;
    }
  }
  return best;
}

std::optional<size_t> BreakPointFinder::find_word_boundary(std::string_view text, size_t target,
                                                           size_t window) {
  if (text.empty()) {
    return std::nullopt;
  }
  const size_t region_begin = target > window ? target - window : 0;
  const size_t region_end = std::min(text.size(), target + window);

  std::optional<size_t> best;
  size_t best_distance = 0;
  for (size_t pos = region_begin; pos < region_end; ++pos) {
    if (!text_utils::is_space(text[pos])) {
      continue;
    }
    const size_t distance = pos > target ? pos - target : target - pos;
    if (!best || distance < best_distance) {
      best = pos;
      best_distance = distance;
    }
  }
  // A boundary at offset 0 would produce an empty chunk.
  if (best && *best == 0) {
    return std::nullopt;
  }
  return best;
}

std::optional<size_t> BreakPointFinder::last_whitespace_before(std::string_view text, size_t lower,
                                                              size_t upper) {
  upper = std::min(upper, text.size());
  for (size_t pos = upper; pos > lower + 1; --pos) {
    if (text_utils::is_space(text[pos - 1])) {
      return pos - 1;
    }
  }
  return std::nullopt;
}

size_t BreakPointFinder::end_of_token(std::string_view text, size_t pos) {
  while (pos < text.size() && !text_utils::is_space(text[pos])) {
    ++pos;
  }
  return std::min(pos, text.size());
}

}  // namespace tome_core
