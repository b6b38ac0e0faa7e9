#include "tome_core/indexer/text_cleaner.hpp"

#include <utf8.h>

#include <iterator>
#include <map>
#include <regex>
#include <set>

#include "tome_core/utils/text_utils.hpp"

namespace tome_core {

namespace {

std::string normalize_line_endings(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
    } else {
      out.push_back(text[i]);
    }
  }
  return out;
}

bool is_dropped_control(char c) {
  const auto uc = static_cast<unsigned char>(c);
  if (c == '\t' || c == '\n') {
    return false;
  }
  return uc < 0x20 || uc == 0x7F;
}

std::string collapse_spaces(std::string_view line) {
  std::string out;
  out.reserve(line.size());
  for (char c : line) {
    if (c == ' ' && !out.empty() && out.back() == ' ') {
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::string normalize_for_comparison(std::string_view line) {
  return text_utils::to_lower(text_utils::trim_view(line));
}

}  // namespace

bool TextCleaner::is_page_number_line(std::string_view trimmed_line) {
  static const std::regex page_number_regex(R"(^(?:\d+|[Pp][Aa][Gg][Ee]\s+\d+|-\s*\d+\s*-)$)");
  return std::regex_match(trimmed_line.begin(), trimmed_line.end(), page_number_regex);
}

bool TextCleaner::is_boilerplate_line(std::string_view trimmed_line) {
  if (trimmed_line.find("\xC2\xA9") != std::string_view::npos) {
    return true;
  }
  return text_utils::to_lower(trimmed_line).find("all rights reserved") != std::string::npos;
}

std::string TextCleaner::clean_text(std::string_view text) {
  std::string normalized = normalize_line_endings(text);

  std::string valid_utf8;
  utf8::replace_invalid(normalized.begin(), normalized.end(), std::back_inserter(valid_utf8));

  std::string without_controls;
  without_controls.reserve(valid_utf8.size());
  for (char c : valid_utf8) {
    if (!is_dropped_control(c)) {
      without_controls.push_back(c);
    }
  }

  std::string cleaned;
  cleaned.reserve(without_controls.size());
  bool previous_blank = false;
  for (auto line : text_utils::split_lines(without_controls)) {
    std::string_view trimmed = text_utils::trim_view(line);
    if (is_page_number_line(trimmed) || is_boilerplate_line(trimmed)) {
      trimmed = std::string_view();
    }

    const std::string collapsed = collapse_spaces(trimmed);
    if (collapsed.empty()) {
      if (previous_blank) {
        continue;
      }
      previous_blank = true;
    } else {
      previous_blank = false;
    }
    cleaned.append(collapsed);
    cleaned.push_back('\n');
  }

  return text_utils::trim(cleaned);
}

std::vector<PageText> TextCleaner::remove_repeated_headers_footers(
    const std::vector<PageText>& pages) {
  if (pages.size() < MIN_PAGES_FOR_REPEAT_DETECTION) {
    return pages;
  }

  // Number of pages on which each normalized edge line appears.
  std::map<std::string, size_t> line_frequency;
  for (const auto& page : pages) {
    const auto lines = text_utils::split_lines(page.text);
    std::set<std::string> edge_lines;
    for (size_t i = 0; i < lines.size(); ++i) {
      const bool near_top = i < EDGE_LINES;
      const bool near_bottom = i + EDGE_LINES >= lines.size();
      if (!near_top && !near_bottom) {
        continue;
      }
      std::string normalized = normalize_for_comparison(lines[i]);
      if (!normalized.empty()) {
        edge_lines.insert(std::move(normalized));
      }
    }
    for (const auto& line : edge_lines) {
      ++line_frequency[line];
    }
  }

  const double threshold = static_cast<double>(pages.size()) * REPEATED_LINE_PAGE_RATIO;
  std::set<std::string> repeated_lines;
  for (const auto& [line, count] : line_frequency) {
    if (static_cast<double>(count) >= threshold && line.size() < MAX_REPEATED_LINE_LENGTH) {
      repeated_lines.insert(line);
    }
  }

  std::vector<PageText> result;
  result.reserve(pages.size());
  for (const auto& page : pages) {
    std::string kept;
    for (auto line : text_utils::split_lines(page.text)) {
      if (repeated_lines.count(normalize_for_comparison(line)) > 0) {
        continue;
      }
      kept.append(line);
      kept.push_back('\n');
    }
    result.push_back({text_utils::trim(kept), page.page_number});
  }
  return result;
}

}  // namespace tome_core
