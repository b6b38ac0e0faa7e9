#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tome_core/indexer/chunk_assembler.hpp"
#include "tome_core/indexer/chunking_config.hpp"
#include "tome_core/indexer/keyword_extractor.hpp"
#include "tome_core/indexer/score_hint_analyzer.hpp"
#include "tome_core/indexer/section_extractor.hpp"
#include "tome_core/indexer/table_detector.hpp"
#include "tome_core/types/chunk.hpp"
#include "tome_core/types/page.hpp"
#include "tome_core/types/rules_table.hpp"
#include "tome_core/types/section.hpp"

namespace tome_core {

struct PipelineOptions {
  bool clean_text = true;
  bool strip_repeated_lines = true;
  bool detect_tables = true;
};

struct IndexingResult {
  std::string source_id;
  // SHA-256 of the cleaned pages.
  std::string content_hash;
  std::vector<Section> sections;
  std::vector<Chunk> chunks;
  std::vector<RulesTable> tables;
  std::vector<RulesDataset> datasets;
};

/**
 * @class IndexingPipeline
 * @brief Turns one source document into its sections, chunks and tables.
 *
 * Runs are independent: the pipeline holds only read-only configuration and
 * can be shared by any number of threads.
 */
class IndexingPipeline {
 public:
  IndexingPipeline(ChunkingConfig config = {}, PipelineOptions options = {},
                   std::shared_ptr<const KeywordExtractor> keyword_extractor =
                       std::make_shared<const KeywordExtractor>(),
                   std::shared_ptr<const ScoreHintAnalyzer> hint_analyzer =
                       std::make_shared<const ScoreHintAnalyzer>(),
                   SectionExtractor section_extractor = SectionExtractor());

  /**
   * @brief Cleans, segments and chunks the document.
   * @throw IndexerError if page numbers are < 1 or not strictly increasing.
   */
  IndexingResult run(const SourceDocument& document) const;

  // Throws IndexerError describing the first malformed page.
  static void validate_pages(const std::vector<PageText>& pages);

  const PipelineOptions& options() const {
    return options_;
  }

 private:
  std::vector<PageText> prepare_pages(const std::vector<PageText>& pages) const;

  // Scans each section (its header line, then its body) or, without
  // sections, each page.
  std::vector<RulesTable> detect_tables(const std::vector<PageText>& pages,
                                        const std::vector<Section>& sections,
                                        const std::string& source_id) const;

  PipelineOptions options_;
  SectionExtractor section_extractor_;
  ChunkAssembler chunk_assembler_;
  TableDetector table_detector_;
};

}  // namespace tome_core
