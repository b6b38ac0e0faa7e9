#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tome_core {

/**
 * @class KeywordExtractor
 * @brief Matches text against a fixed vocabulary of wargame rule terms.
 *
 * Matching is a case-insensitive substring test, so "d6" matches inside
 * "2d6+1" and "roll" matches inside "Rolling". Each term is reported at most
 * once, in vocabulary order.
 */
class KeywordExtractor {
 public:
  // Uses default_vocabulary().
  KeywordExtractor();

  // Terms are lowercased; empty and duplicate terms are dropped.
  explicit KeywordExtractor(const std::vector<std::string>& vocabulary);

  static const std::vector<std::string>& default_vocabulary();

  // Default vocabulary followed by the given extra terms.
  static KeywordExtractor with_extra_terms(const std::vector<std::string>& extra_terms);

  std::vector<std::string> extract(std::string_view text) const;

  const std::vector<std::string>& vocabulary() const {
    return vocabulary_;
  }

 private:
  std::vector<std::string> vocabulary_;
};

}  // namespace tome_core
