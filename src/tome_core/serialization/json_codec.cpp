#include "tome_core/serialization/json_codec.hpp"

namespace tome_core {

namespace {

void set_hint(nlohmann::json& j, const char* key, const std::optional<bool>& flag) {
  if (flag) {
    j[key] = *flag;
  }
}

std::optional<bool> get_hint(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<bool>();
}

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

void to_json(nlohmann::json& j, const PageText& page) {
  j = nlohmann::json{{"text", page.text}, {"page_number", page.page_number}};
}

void from_json(const nlohmann::json& j, PageText& page) {
  j.at("text").get_to(page.text);
  j.at("page_number").get_to(page.page_number);
}

void to_json(nlohmann::json& j, const SourceDocument& document) {
  j = nlohmann::json{{"source_id", document.source_id}, {"pages", document.pages}};
}

void from_json(const nlohmann::json& j, SourceDocument& document) {
  j.at("source_id").get_to(document.source_id);
  j.at("pages").get_to(document.pages);
}

void to_json(nlohmann::json& j, const ScoreHints& hints) {
  j = nlohmann::json::object();
  set_hint(j, "hasRollRanges", hints.has_roll_ranges);
  set_hint(j, "hasTablePattern", hints.has_table_pattern);
  set_hint(j, "hasListPattern", hints.has_list_pattern);
  set_hint(j, "hasDiceNotation", hints.has_dice_notation);
}

void from_json(const nlohmann::json& j, ScoreHints& hints) {
  hints.has_roll_ranges = get_hint(j, "hasRollRanges");
  hints.has_table_pattern = get_hint(j, "hasTablePattern");
  hints.has_list_pattern = get_hint(j, "hasListPattern");
  hints.has_dice_notation = get_hint(j, "hasDiceNotation");
}

void to_json(nlohmann::json& j, const Section& section) {
  j = nlohmann::json{
      {"id", section.id},
      {"source_id", section.source_id},
      {"title", section.title},
      {"section_path", section.section_path},
      {"level", section.level},
      {"page_start", section.page_start},
      {"page_end", section.page_end},
      {"text", optional_to_json(section.text)},
      {"keywords", section.keywords},
  };
}

void to_json(nlohmann::json& j, const Chunk& chunk) {
  j = nlohmann::json{
      {"source_id", chunk.source_id},
      {"section_id", optional_to_json(chunk.section_id)},
      {"text", chunk.text},
      {"page_start", chunk.page_start},
      {"page_end", chunk.page_end},
      {"section_path", chunk.section_path},
      {"order_index", chunk.order_index},
      {"keywords", chunk.keywords},
      {"score_hints", chunk.score_hints},
  };
}

void to_json(nlohmann::json& j, const RulesTable& table) {
  j = nlohmann::json{
      {"source_id", table.source_id},
      {"section_id", optional_to_json(table.section_id)},
      {"title_guess", optional_to_json(table.title_guess)},
      {"header_context", table.header_context},
      {"page_number", table.page_number},
      {"raw_text", table.raw_text},
      {"parsed_rows", table.parsed_rows},
      {"confidence", to_string(table.confidence)},
      {"table_type", to_string(table.type)},
      {"keywords", table.keywords},
  };
}

void to_json(nlohmann::json& j, const DatasetRow& row) {
  j = nlohmann::json{{"data", row.data}, {"page_number", row.page_number}};
}

void to_json(nlohmann::json& j, const RulesDataset& dataset) {
  j = nlohmann::json{
      {"source_id", dataset.source_id},
      {"name", dataset.name},
      {"dataset_type", dataset.dataset_type},
      {"fields", dataset.fields},
      {"confidence", to_string(dataset.confidence)},
      {"rows", dataset.rows},
  };
}

void to_json(nlohmann::json& j, const IndexingResult& result) {
  j = nlohmann::json{
      {"source_id", result.source_id},
      {"content_hash", result.content_hash},
      {"sections", result.sections},
      {"chunks", result.chunks},
      {"tables", result.tables},
      {"datasets", result.datasets},
  };
}

}  // namespace tome_core
