#include "tome_core/indexer/keyword_extractor.hpp"

#include <algorithm>

#include "tome_core/utils/text_utils.hpp"

namespace tome_core {

namespace {

// Damage, combat, campaign and dice terminology found in skirmish rulebooks.
const std::vector<std::string> kDefaultVocabulary = {
    "injury",     "wound",     "damage",    "attack",     "defense",    "armour",
    "armor",      "skill",     "ability",   "trait",      "equipment",  "weapon",
    "item",       "exploration", "loot",    "treasure",   "encounter",  "event",
    "advancement", "experience", "level",   "upgrade",    "warband",    "unit",
    "model",      "hero",      "henchman",  "deployment", "scenario",   "mission",
    "objective",  "movement",  "shooting",  "combat",     "melee",      "ranged",
    "morale",     "rout",      "flee",      "recovery",   "d6",         "d66",
    "d3",         "d10",       "d20",       "dice",       "roll",       "table",
    "chart",      "list",
};

}  // namespace

KeywordExtractor::KeywordExtractor() : vocabulary_(kDefaultVocabulary) {}

KeywordExtractor::KeywordExtractor(const std::vector<std::string>& vocabulary) {
  vocabulary_.reserve(vocabulary.size());
  for (const auto& term : vocabulary) {
    std::string lowered = text_utils::to_lower(text_utils::trim(term));
    if (lowered.empty()) {
      continue;
    }
    if (std::find(vocabulary_.begin(), vocabulary_.end(), lowered) == vocabulary_.end()) {
      vocabulary_.push_back(std::move(lowered));
    }
  }
}

const std::vector<std::string>& KeywordExtractor::default_vocabulary() {
  return kDefaultVocabulary;
}

KeywordExtractor KeywordExtractor::with_extra_terms(const std::vector<std::string>& extra_terms) {
  std::vector<std::string> terms = kDefaultVocabulary;
  terms.insert(terms.end(), extra_terms.begin(), extra_terms.end());
  return KeywordExtractor(terms);
}

std::vector<std::string> KeywordExtractor::extract(std::string_view text) const {
  std::vector<std::string> keywords;
  if (text.empty()) {
    return keywords;
  }

  const std::string lower_text = text_utils::to_lower(text);
  for (const auto& term : vocabulary_) {
    if (lower_text.find(term) != std::string::npos) {
      keywords.push_back(term);
    }
  }
  return keywords;
}

}  // namespace tome_core
