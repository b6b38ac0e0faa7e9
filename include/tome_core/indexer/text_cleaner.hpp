#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "tome_core/types/page.hpp"

namespace tome_core {

/**
 * @class TextCleaner
 * @brief Removes common extraction artifacts from page text.
 */
class TextCleaner {
 public:
  // A line must repeat on at least this share of pages to count as a running header/footer.
  static constexpr double REPEATED_LINE_PAGE_RATIO = 0.6;
  // Lines scanned at the top and at the bottom of every page.
  static constexpr size_t EDGE_LINES = 5;
  static constexpr size_t MAX_REPEATED_LINE_LENGTH = 100;
  static constexpr size_t MIN_PAGES_FOR_REPEAT_DETECTION = 3;

  /**
   * @brief Normalizes one page of text.
   *
   * Line endings become '\n', invalid UTF-8 is replaced with U+FFFD, control
   * characters other than tab and newline are dropped, page-number and
   * copyright lines are blanked, runs of spaces collapse to one, line ends are
   * trimmed and runs of blank lines collapse to a single blank line. Tabs are
   * kept.
   */
  static std::string clean_text(std::string_view text);

  /**
   * @brief Drops running headers and footers.
   *
   * Lines found near the top or bottom of at least REPEATED_LINE_PAGE_RATIO of
   * the pages are removed from every page. Documents with fewer than
   * MIN_PAGES_FOR_REPEAT_DETECTION pages are returned unchanged.
   */
  static std::vector<PageText> remove_repeated_headers_footers(const std::vector<PageText>& pages);

  // True for "12", "Page 12" and "- 12 -".
  static bool is_page_number_line(std::string_view trimmed_line);

  // True for copyright and "All Rights Reserved" lines.
  static bool is_boilerplate_line(std::string_view trimmed_line);
};

}  // namespace tome_core
