#pragma once

#include <nlohmann/json.hpp>

#include "tome_core/indexer/indexing_pipeline.hpp"
#include "tome_core/types/chunk.hpp"
#include "tome_core/types/page.hpp"
#include "tome_core/types/rules_table.hpp"
#include "tome_core/types/section.hpp"

// nlohmann::json conversions for the records exchanged with the ingestion job.
// Field names follow the storage schema (snake_case); score hint keys keep
// the camelCase names the scorer reads, and only detected hints are written.
namespace tome_core {

void to_json(nlohmann::json& j, const PageText& page);
void from_json(const nlohmann::json& j, PageText& page);

void to_json(nlohmann::json& j, const SourceDocument& document);
void from_json(const nlohmann::json& j, SourceDocument& document);

void to_json(nlohmann::json& j, const ScoreHints& hints);
void from_json(const nlohmann::json& j, ScoreHints& hints);

void to_json(nlohmann::json& j, const Section& section);
void to_json(nlohmann::json& j, const Chunk& chunk);
void to_json(nlohmann::json& j, const RulesTable& table);
void to_json(nlohmann::json& j, const DatasetRow& row);
void to_json(nlohmann::json& j, const RulesDataset& dataset);
void to_json(nlohmann::json& j, const IndexingResult& result);

}  // namespace tome_core
