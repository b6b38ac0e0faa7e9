#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tome_core::text_utils {

// ASCII whitespace: space, \t, \n, \v, \f, \r.
bool is_space(char c);

std::string_view trim_view(std::string_view text);
std::string trim(std::string_view text);

// ASCII case mapping; bytes >= 0x80 are left untouched.
std::string to_lower(std::string_view text);
std::string to_upper(std::string_view text);

// Splits on '\n' and drops a trailing '\r' from each line. An empty input
// yields a single empty line.
std::vector<std::string_view> split_lines(std::string_view text);

// Moves pos forward to the first byte that does not continue a UTF-8 sequence.
size_t align_to_codepoint(std::string_view text, size_t pos);

}  // namespace tome_core::text_utils
