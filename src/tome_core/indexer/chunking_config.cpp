#include "tome_core/indexer/chunking_config.hpp"

#include <string>

#include "tome_core/indexer/indexer_error.hpp"

namespace tome_core {

void ChunkingConfig::validate() const {
  if (min_size == 0) {
    throw IndexerError("min_size must be greater than zero");
  }
  if (!(overlap_size < min_size && min_size < target_size && target_size < max_size)) {
    throw IndexerError("Chunk sizes must satisfy overlap < min < target < max (got overlap=" +
                       std::to_string(overlap_size) + ", min=" + std::to_string(min_size) +
                       ", target=" + std::to_string(target_size) +
                       ", max=" + std::to_string(max_size) + ")");
  }
  if (word_boundary_window >= target_size || target_size + word_boundary_window > max_size) {
    throw IndexerError("word_boundary_window must fit between target_size and max_size");
  }
}

}  // namespace tome_core
