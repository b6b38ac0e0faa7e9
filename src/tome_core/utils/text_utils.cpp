#include "tome_core/utils/text_utils.hpp"

#include <cctype>

namespace tome_core::text_utils {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

std::string_view trim_view(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && is_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_space(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string trim(std::string_view text) {
  return std::string(trim_view(text));
}

std::string to_lower(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x80) {
      c = static_cast<char>(std::tolower(uc));
    }
  }
  return out;
}

std::string to_upper(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x80) {
      c = static_cast<char>(std::toupper(uc));
    }
  }
  return out;
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (true) {
    const size_t newline = text.find('\n', start);
    std::string_view line = newline == std::string_view::npos
                                ? text.substr(start)
                                : text.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    if (newline == std::string_view::npos) {
      break;
    }
    start = newline + 1;
  }
  return lines;
}

size_t align_to_codepoint(std::string_view text, size_t pos) {
  // Continuation bytes are 10xxxxxx.
  while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
    ++pos;
  }
  return pos < text.size() ? pos : text.size();
}

}  // namespace tome_core::text_utils
