#include "tome_core/indexer/indexing_pipeline.hpp"

#include <iterator>
#include <string>

#include "tome_core/indexer/indexer_error.hpp"
#include "tome_core/indexer/text_cleaner.hpp"
#include "tome_core/utils/content_hash.hpp"
#include "tome_core/utils/text_utils.hpp"

namespace tome_core {

namespace {

std::string hash_pages(const std::vector<PageText>& pages) {
  std::string content;
  for (const auto& page : pages) {
    content.append(std::to_string(page.page_number));
    content.push_back('\n');
    content.append(page.text);
    content.push_back('\f');
  }
  return compute_hash_from_content(content);
}

}  // namespace

IndexingPipeline::IndexingPipeline(ChunkingConfig config,
                                   PipelineOptions options,
                                   std::shared_ptr<const KeywordExtractor> keyword_extractor,
                                   std::shared_ptr<const ScoreHintAnalyzer> hint_analyzer,
                                   SectionExtractor section_extractor)
    : options_(options),
      section_extractor_(std::move(section_extractor)),
      chunk_assembler_(
          TextSegmenter(config, std::move(keyword_extractor), std::move(hint_analyzer))) {}

void IndexingPipeline::validate_pages(const std::vector<PageText>& pages) {
  int previous = 0;
  for (const auto& page : pages) {
    if (page.page_number < 1) {
      throw IndexerError("Invalid page number " + std::to_string(page.page_number) +
                         ": page numbers start at 1");
    }
    if (page.page_number <= previous) {
      throw IndexerError("Pages out of order: page " + std::to_string(page.page_number) +
                         " follows page " + std::to_string(previous));
    }
    previous = page.page_number;
  }
}

std::vector<PageText> IndexingPipeline::prepare_pages(const std::vector<PageText>& pages) const {
  std::vector<PageText> prepared =
      options_.strip_repeated_lines ? TextCleaner::remove_repeated_headers_footers(pages) : pages;
  if (options_.clean_text) {
    for (auto& page : prepared) {
      page.text = TextCleaner::clean_text(page.text);
    }
  }
  return prepared;
}

std::vector<RulesTable> IndexingPipeline::detect_tables(const std::vector<PageText>& pages,
                                                        const std::vector<Section>& sections,
                                                        const std::string& source_id) const {
  std::vector<RulesTable> tables;
  auto append = [&tables](std::vector<RulesTable>&& found) {
    tables.insert(tables.end(), std::make_move_iterator(found.begin()),
                  std::make_move_iterator(found.end()));
  };

  if (sections.empty()) {
    for (const auto& page : pages) {
      append(table_detector_.detect(page.text, page.page_number, source_id));
    }
    return tables;
  }

  for (const auto& section : sections) {
    if (!section.text || text_utils::trim_view(*section.text).empty()) {
      continue;
    }
    // The header line is the title a table directly below it would carry.
    append(table_detector_.detect(section.title + "\n" + *section.text, section.page_start,
                                  source_id, section.id));
  }
  return tables;
}

IndexingResult IndexingPipeline::run(const SourceDocument& document) const {
  validate_pages(document.pages);

  const std::vector<PageText> pages = prepare_pages(document.pages);

  IndexingResult result;
  result.source_id = document.source_id;
  result.content_hash = hash_pages(pages);
  result.sections = section_extractor_.extract(pages, document.source_id);
  result.chunks = chunk_assembler_.assemble(pages, result.sections, document.source_id);
  if (options_.detect_tables) {
    result.tables = detect_tables(pages, result.sections, document.source_id);
    result.datasets = TableDetector::detect_datasets(result.tables, document.source_id);
  }
  return result;
}

}  // namespace tome_core
