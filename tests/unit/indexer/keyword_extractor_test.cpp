#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "tome_core/indexer/keyword_extractor.hpp"

namespace tome_tests {

using namespace tome_core;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Not;

class KeywordExtractorTest : public ::testing::Test {
 protected:
  KeywordExtractor extractor_;
};

TEST_F(KeywordExtractorTest, MatchesCaseInsensitively) {
  auto keywords = extractor_.extract("Combat Rules. Roll 1d6 to hit.");

  EXPECT_THAT(keywords, Contains("combat"));
  EXPECT_THAT(keywords, Contains("roll"));
  EXPECT_THAT(keywords, Contains("d6"));
}

TEST_F(KeywordExtractorTest, MatchesSubstringsInsideLongerWords) {
  // "rolling" contains "roll", "2d66" contains both "d6" and "d66".
  auto keywords = extractor_.extract("Rolling 2d66 on the chart");

  EXPECT_THAT(keywords, ElementsAre("d6", "d66", "roll", "chart"));
}

TEST_F(KeywordExtractorTest, ReportsEachTermOnceInVocabularyOrder) {
  auto keywords = extractor_.extract("attack, attack, WOUND and attack again. wound.");

  EXPECT_THAT(keywords, ElementsAre("wound", "attack"));
}

TEST_F(KeywordExtractorTest, ReturnsEmptyForTextWithoutTerms) {
  EXPECT_THAT(extractor_.extract(""), IsEmpty());
  EXPECT_THAT(extractor_.extract("The quick brown fox."), IsEmpty());
}

TEST_F(KeywordExtractorTest, ExtractionIsIdempotent) {
  const std::string text = "Each hero may roll on the injury table after the mission.";
  EXPECT_EQ(extractor_.extract(text), extractor_.extract(text));
}

TEST_F(KeywordExtractorTest, CustomVocabularyIsNormalized) {
  KeywordExtractor custom({"  Psyker ", "PSYKER", "", "Warp"});

  EXPECT_THAT(custom.vocabulary(), ElementsAre("psyker", "warp"));
  EXPECT_THAT(custom.extract("The psyker enters the WARP."), ElementsAre("psyker", "warp"));
  EXPECT_THAT(custom.extract("combat"), IsEmpty());
}

TEST_F(KeywordExtractorTest, ExtraTermsFollowTheDefaultVocabulary) {
  auto extended = KeywordExtractor::with_extra_terms({"psyker", "combat"});

  EXPECT_EQ(extended.vocabulary().size(), KeywordExtractor::default_vocabulary().size() + 1);
  EXPECT_EQ(extended.vocabulary().back(), "psyker");
  EXPECT_THAT(extended.extract("Psyker combat"), ElementsAre("combat", "psyker"));
  EXPECT_THAT(extractor_.extract("Psyker"), Not(Contains("psyker")));
}

}  // namespace tome_tests
