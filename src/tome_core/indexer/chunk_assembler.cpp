#include "tome_core/indexer/chunk_assembler.hpp"

#include <iterator>

#include "tome_core/utils/text_utils.hpp"

namespace tome_core {

namespace {

void append_chunks(std::vector<Chunk>& all_chunks, std::vector<Chunk>&& chunks) {
  all_chunks.insert(all_chunks.end(), std::make_move_iterator(chunks.begin()),
                    std::make_move_iterator(chunks.end()));
}

}  // namespace

ChunkAssembler::ChunkAssembler(TextSegmenter segmenter) : segmenter_(std::move(segmenter)) {}

std::vector<Chunk> ChunkAssembler::assemble(const std::vector<PageText>& pages,
                                            const std::vector<Section>& sections,
                                            const std::string& source_id) const {
  if (!sections.empty()) {
    return assemble_sections(sections, source_id);
  }
  return assemble_pages(pages, source_id);
}

std::vector<Chunk> ChunkAssembler::assemble_sections(const std::vector<Section>& sections,
                                                     const std::string& source_id) const {
  std::vector<Chunk> all_chunks;
  for (const auto& section : sections) {
    if (!section.text || text_utils::trim_view(*section.text).empty()) {
      continue;
    }

    SegmentInput input;
    input.text = *section.text;
    input.page_number = section.page_start;
    input.section_path = section.section_path;
    input.section_id = section.id;
    input.source_id = source_id;

    append_chunks(all_chunks, segmenter_.segment(input, static_cast<int>(all_chunks.size())));
  }
  return all_chunks;
}

std::vector<Chunk> ChunkAssembler::assemble_pages(const std::vector<PageText>& pages,
                                                  const std::string& source_id) const {
  std::vector<Chunk> all_chunks;
  for (const auto& page : pages) {
    if (text_utils::trim_view(page.text).empty()) {
      continue;
    }

    SegmentInput input;
    input.text = page.text;
    input.page_number = page.page_number;
    input.source_id = source_id;

    append_chunks(all_chunks, segmenter_.segment(input, static_cast<int>(all_chunks.size())));
  }
  return all_chunks;
}

}  // namespace tome_core
