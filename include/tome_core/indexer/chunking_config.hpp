#pragma once

#include <cstddef>

namespace tome_core {

/**
 * @brief Size bounds used by the TextSegmenter, in bytes of UTF-8 text.
 *
 * Must satisfy overlap_size < min_size < target_size < max_size.
 */
struct ChunkingConfig {
  static constexpr size_t DEFAULT_TARGET_SIZE = 1800;
  static constexpr size_t DEFAULT_MIN_SIZE = 500;
  static constexpr size_t DEFAULT_MAX_SIZE = 2500;
  static constexpr size_t DEFAULT_OVERLAP_SIZE = 200;
  static constexpr size_t DEFAULT_WORD_BOUNDARY_WINDOW = 50;

  size_t target_size = DEFAULT_TARGET_SIZE;
  size_t min_size = DEFAULT_MIN_SIZE;
  size_t max_size = DEFAULT_MAX_SIZE;
  size_t overlap_size = DEFAULT_OVERLAP_SIZE;
  // How far around target_size to look for whitespace when no paragraph break fits.
  size_t word_boundary_window = DEFAULT_WORD_BOUNDARY_WINDOW;

  // Throws IndexerError when the bounds are inconsistent.
  void validate() const;
};

}  // namespace tome_core
