#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tome_core {

struct Section {
  std::string id;
  std::string source_id;
  std::string title;
  std::vector<std::string> section_path;
  int level = 1;
  int page_start = 1;
  int page_end = 1;
  // Absent when the header captured no body.
  std::optional<std::string> text;
  std::vector<std::string> keywords;
};

}  // namespace tome_core
