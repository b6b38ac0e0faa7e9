#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace tome_core {

/**
 * @class BreakPointFinder
 * @brief Locates the offsets at which a span of text may be split.
 */
class BreakPointFinder {
 public:
  /**
   * @brief Offsets immediately following each run of blank lines.
   *
   * A paragraph break is a newline, any whitespace, and another newline. The
   * reported offset is the first byte after the run. Offsets are ascending.
   */
  static std::vector<size_t> find_natural_break_points(std::string_view text);

  /**
   * @brief Picks the break strictly inside (lower, upper) closest to target.
   *
   * On equal distance the earlier break wins.
   */
  static std::optional<size_t> closest_break_between(const std::vector<size_t>& break_points,
                                                     size_t lower, size_t upper, size_t target);

  /**
   * @brief Finds the whitespace nearest to target within +/- window bytes.
   *
   * The returned offset points at the whitespace byte, so the text before it
   * ends on a whole word.
   */
  static std::optional<size_t> find_word_boundary(std::string_view text, size_t target,
                                                  size_t window);

  /**
   * @brief Last whitespace strictly inside (lower, upper).
   *
   * Used when no whitespace lies near the target: the chunk then ends on the
   * last whole word before the target instead of absorbing a long token.
   */
  static std::optional<size_t> last_whitespace_before(std::string_view text, size_t lower,
                                                      size_t upper);

  // Offset of the first whitespace at or after pos, or text.size().
  static size_t end_of_token(std::string_view text, size_t pos);
};

}  // namespace tome_core
