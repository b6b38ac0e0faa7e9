#pragma once

#include <string>
#include <vector>

#include "tome_core/indexer/text_segmenter.hpp"
#include "tome_core/types/chunk.hpp"
#include "tome_core/types/page.hpp"
#include "tome_core/types/section.hpp"

namespace tome_core {

/**
 * @class ChunkAssembler
 * @brief Produces the ordered chunk list of one source document.
 *
 * With sections, every section body is segmented in detection order and the
 * section's first page stands for all of its chunks. Without sections, every
 * page is segmented on its own. order_index runs from 0 without gaps across
 * the whole document.
 */
class ChunkAssembler {
 public:
  explicit ChunkAssembler(TextSegmenter segmenter);

  std::vector<Chunk> assemble(const std::vector<PageText>& pages,
                              const std::vector<Section>& sections,
                              const std::string& source_id) const;

 private:
  std::vector<Chunk> assemble_sections(const std::vector<Section>& sections,
                                       const std::string& source_id) const;
  std::vector<Chunk> assemble_pages(const std::vector<PageText>& pages,
                                    const std::string& source_id) const;

  TextSegmenter segmenter_;
};

}  // namespace tome_core
