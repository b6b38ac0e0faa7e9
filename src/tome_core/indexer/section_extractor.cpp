#include "tome_core/indexer/section_extractor.hpp"

#include <algorithm>
#include <regex>

#include "tome_core/utils/content_hash.hpp"
#include "tome_core/utils/text_utils.hpp"

namespace tome_core {

namespace {

struct DocumentLine {
  std::string_view text;
  int page_number;
  size_t line_index;
};

// Every line of every non-blank page, in reading order.
std::vector<DocumentLine> flatten_pages(const std::vector<PageText>& pages) {
  std::vector<DocumentLine> lines;
  for (const auto& page : pages) {
    if (text_utils::trim_view(page.text).empty()) {
      continue;
    }
    const auto page_lines = text_utils::split_lines(page.text);
    for (size_t i = 0; i < page_lines.size(); ++i) {
      lines.push_back({page_lines[i], page.page_number, i});
    }
  }
  return lines;
}

bool is_ascii_upper(char c) {
  return c >= 'A' && c <= 'Z';
}

bool is_ascii_lower(char c) {
  return c >= 'a' && c <= 'z';
}

bool is_ascii_digit(char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

namespace header_rules {

std::optional<int> all_caps(const HeaderCandidate& candidate) {
  const std::string_view line = candidate.trimmed;
  if (text_utils::to_upper(line) != line) {
    return std::nullopt;
  }
  if (std::none_of(line.begin(), line.end(), is_ascii_upper)) {
    return std::nullopt;
  }
  if (std::all_of(line.begin(), line.end(), is_ascii_digit)) {
    return std::nullopt;
  }
  return 1;
}

std::optional<int> numbered_heading(const HeaderCandidate& candidate) {
  // "2.1. Combat": dotted numeric prefix, whitespace, capital letter.
  static const std::regex numbered_regex(R"(^((?:\d+\.)+)\s+[A-Z])");
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(candidate.trimmed.begin(), candidate.trimmed.end(), match,
                         numbered_regex)) {
    return std::nullopt;
  }
  const std::string prefix = match[1].str();
  return static_cast<int>(std::count(prefix.begin(), prefix.end(), '.'));
}

std::optional<int> title_case_before_blank(const HeaderCandidate& candidate) {
  const std::string_view line = candidate.trimmed;
  if (line.size() < 2 || !is_ascii_upper(line[0]) || !is_ascii_lower(line[1])) {
    return std::nullopt;
  }
  if (line.back() == '.') {
    return std::nullopt;
  }
  if (candidate.next_trimmed && !candidate.next_trimmed->empty()) {
    return std::nullopt;
  }
  return 2;
}

}  // namespace header_rules

SectionExtractor::SectionExtractor() : rules_(default_rules()) {}

SectionExtractor::SectionExtractor(std::vector<HeaderRule> rules) : rules_(std::move(rules)) {}

std::vector<HeaderRule> SectionExtractor::default_rules() {
  return {
      {"all_caps", header_rules::all_caps},
      {"numbered_heading", header_rules::numbered_heading},
      {"title_case_before_blank", header_rules::title_case_before_blank},
  };
}

std::optional<HeaderMatch> SectionExtractor::classify(const HeaderCandidate& candidate) const {
  const size_t length = candidate.trimmed.size();
  if (length < MIN_HEADER_LENGTH || length > MAX_HEADER_LENGTH) {
    return std::nullopt;
  }
  for (const auto& rule : rules_) {
    if (auto level = rule.classify(candidate)) {
      return HeaderMatch{*level, rule.name};
    }
  }
  return std::nullopt;
}

std::vector<DetectedHeader> SectionExtractor::detect_headers(
    const std::vector<PageText>& pages) const {
  const std::vector<DocumentLine> lines = flatten_pages(pages);
  std::vector<DetectedHeader> headers;

  for (size_t i = 0; i < lines.size(); ++i) {
    HeaderCandidate candidate;
    candidate.trimmed = text_utils::trim_view(lines[i].text);
    if (i + 1 < lines.size()) {
      candidate.next_trimmed = text_utils::trim_view(lines[i + 1].text);
    }

    if (auto match = classify(candidate)) {
      DetectedHeader header;
      header.title = std::string(candidate.trimmed);
      header.level = match->level;
      header.rule = match->rule;
      header.line_position = i;
      header.page_number = lines[i].page_number;
      header.line_index = lines[i].line_index;
      headers.push_back(std::move(header));
    }
  }
  return headers;
}

std::vector<Section> SectionExtractor::extract(const std::vector<PageText>& pages,
                                               const std::string& source_id) const {
  const std::vector<DocumentLine> lines = flatten_pages(pages);
  const std::vector<DetectedHeader> headers = detect_headers(pages);

  std::vector<Section> sections;
  sections.reserve(headers.size());

  for (size_t h = 0; h < headers.size(); ++h) {
    const DetectedHeader& header = headers[h];
    const bool has_next = h + 1 < headers.size();
    const size_t body_end = has_next ? headers[h + 1].line_position : lines.size();

    std::string body;
    for (size_t i = header.line_position + 1; i < body_end; ++i) {
      body.append(lines[i].text);
      body.push_back('\n');
    }
    std::string trimmed_body = text_utils::trim(body);

    Section section;
    section.id = make_section_id(source_id, h, header.title);
    section.source_id = source_id;
    section.title = header.title;
    section.section_path = {header.title};
    section.level = header.level;
    section.page_start = header.page_number;
    section.page_end = lines[body_end - 1].page_number;
    if (!trimmed_body.empty()) {
      section.text = std::move(trimmed_body);
    }
    sections.push_back(std::move(section));
  }

  return sections;
}

std::string make_section_id(const std::string& source_id, size_t ordinal, const std::string& title) {
  return compute_hash_from_content(source_id + '\n' + std::to_string(ordinal) + '\n' + title);
}

}  // namespace tome_core
