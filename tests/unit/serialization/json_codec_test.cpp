#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "tome_core/serialization/json_codec.hpp"

namespace tome_tests {

using namespace tome_core;

TEST(JsonCodecTest, ParsesSourceDocument) {
  auto j = nlohmann::json::parse(R"({
    "source_id": "mordheim",
    "pages": [
      {"text": "COMBAT", "page_number": 3},
      {"text": "Roll to hit.", "page_number": 4}
    ]
  })");

  auto document = j.get<SourceDocument>();

  EXPECT_EQ(document.source_id, "mordheim");
  ASSERT_EQ(document.pages.size(), 2u);
  EXPECT_EQ(document.pages[0].text, "COMBAT");
  EXPECT_EQ(document.pages[1].page_number, 4);
}

TEST(JsonCodecTest, MissingFieldsThrow) {
  auto j = nlohmann::json::parse(R"({"source_id": "x", "pages": [{"text": "no number"}]})");

  EXPECT_THROW(j.get<SourceDocument>(), nlohmann::json::exception);
}

TEST(JsonCodecTest, ScoreHintsWriteOnlyDetectedFlags) {
  ScoreHints hints;
  hints.has_dice_notation = true;
  hints.has_roll_ranges = true;

  nlohmann::json j = hints;

  EXPECT_EQ(j, nlohmann::json::object({{"hasDiceNotation", true}, {"hasRollRanges", true}}));
  EXPECT_EQ(nlohmann::json(ScoreHints{}), nlohmann::json::object());
  EXPECT_EQ(j.get<ScoreHints>(), hints);
}

TEST(JsonCodecTest, ChunkUsesNullForAbsentSectionId) {
  Chunk chunk;
  chunk.source_id = "mordheim";
  chunk.text = "Roll to hit.";
  chunk.page_start = 2;
  chunk.page_end = 2;
  chunk.order_index = 3;
  chunk.keywords = {"roll"};

  nlohmann::json j = chunk;

  EXPECT_TRUE(j.at("section_id").is_null());
  EXPECT_EQ(j.at("order_index"), 3);
  EXPECT_EQ(j.at("keywords"), nlohmann::json::array({"roll"}));
  EXPECT_EQ(j.at("score_hints"), nlohmann::json::object());
  EXPECT_TRUE(j.at("section_path").is_array());
}

TEST(JsonCodecTest, IndexingResultNestsSectionsAndChunks) {
  Section section;
  section.id = "abc";
  section.source_id = "mordheim";
  section.title = "COMBAT";
  section.section_path = {"COMBAT"};

  Chunk chunk;
  chunk.source_id = "mordheim";
  chunk.section_id = "abc";
  chunk.text = "Roll to hit.";

  IndexingResult result{"mordheim", "deadbeef", {section}, {chunk}};
  nlohmann::json j = result;

  EXPECT_EQ(j.at("content_hash"), "deadbeef");
  ASSERT_EQ(j.at("sections").size(), 1u);
  EXPECT_TRUE(j.at("sections")[0].at("text").is_null());
  EXPECT_EQ(j.at("sections")[0].at("level"), 1);
  EXPECT_EQ(j.at("chunks")[0].at("section_id"), "abc");
}

TEST(JsonCodecTest, RulesTableWritesLowercaseConfidenceAndNullTitle) {
  RulesTable table;
  table.source_id = "mordheim";
  table.page_number = 4;
  table.raw_text = "Terrain\tCover\nWoods\tPartial";
  TableRow row;
  row["Terrain"] = "Woods";
  row["Cover"] = "Partial";
  table.parsed_rows.push_back(row);
  table.keywords = {"generic"};

  nlohmann::json j = table;

  EXPECT_TRUE(j.at("title_guess").is_null());
  EXPECT_TRUE(j.at("section_id").is_null());
  EXPECT_EQ(j.at("confidence"), "low");
  EXPECT_EQ(j.at("table_type"), "generic");
  EXPECT_EQ(j.at("parsed_rows")[0].at("Cover"), "Partial");
}

TEST(JsonCodecTest, IndexingResultCarriesTablesAndDatasets) {
  RulesTable table;
  table.source_id = "mordheim";
  table.section_id = "abc";
  table.title_guess = "INJURY TABLE";
  table.confidence = Confidence::High;
  table.type = TableType::RollTable;
  TableRow row;
  row["Roll"] = "1-2";
  row["Result"] = "Dead";
  table.parsed_rows.push_back(row);

  RulesDataset dataset{"mordheim", "Injuries", "injuries", {"Roll", "Result"}, Confidence::High,
                       {DatasetRow{row, 12}}};

  IndexingResult result;
  result.source_id = "mordheim";
  result.tables = {table};
  result.datasets = {dataset};
  nlohmann::json j = result;

  ASSERT_EQ(j.at("tables").size(), 1u);
  EXPECT_EQ(j.at("tables")[0].at("title_guess"), "INJURY TABLE");
  EXPECT_EQ(j.at("tables")[0].at("table_type"), "roll_table");
  ASSERT_EQ(j.at("datasets").size(), 1u);
  EXPECT_EQ(j.at("datasets")[0].at("confidence"), "high");
  EXPECT_EQ(j.at("datasets")[0].at("rows")[0].at("page_number"), 12);
  EXPECT_EQ(j.at("datasets")[0].at("rows")[0].at("data").at("Result"), "Dead");
}

}  // namespace tome_tests
