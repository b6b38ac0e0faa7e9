#pragma once

#include <string>
#include <vector>

namespace tome_core {

// One page of already-extracted rulebook text.
struct PageText {
  std::string text;
  int page_number = 1;
};

// All pages of a single source (rulebook), in ascending page order.
struct SourceDocument {
  std::string source_id;
  std::vector<PageText> pages;
};

}  // namespace tome_core
