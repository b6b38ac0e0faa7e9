#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tome_core/indexer/chunking_config.hpp"
#include "tome_core/indexer/indexer_error.hpp"
#include "tome_core/indexer/indexing_pipeline.hpp"

class Config {
 public:
  size_t target_size;
  size_t min_size;
  size_t max_size;
  size_t overlap_size;
  size_t word_boundary_window;
  int num_workers;

  // Text cleaning
  bool clean_text;
  bool strip_repeated_lines;

  // Roll, stats, equipment and column tables
  bool detect_tables;

  // Added to the built-in keyword vocabulary
  std::vector<std::string> extra_keywords;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.target_size = json_config.value("target_size", tome_core::ChunkingConfig::DEFAULT_TARGET_SIZE);
      config.min_size = json_config.value("min_size", tome_core::ChunkingConfig::DEFAULT_MIN_SIZE);
      config.max_size = json_config.value("max_size", tome_core::ChunkingConfig::DEFAULT_MAX_SIZE);
      config.overlap_size = json_config.value("overlap_size", tome_core::ChunkingConfig::DEFAULT_OVERLAP_SIZE);
      config.word_boundary_window =
          json_config.value("word_boundary_window", tome_core::ChunkingConfig::DEFAULT_WORD_BOUNDARY_WINDOW);

      config.clean_text = json_config.value("clean_text", true);
      config.strip_repeated_lines = json_config.value("strip_repeated_lines", true);
      config.detect_tables = json_config.value("detect_tables", true);
      config.extra_keywords = json_config.value("extra_keywords", std::vector<std::string>{});
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value in config: ") + e.what());
    }

    // Handle integer with default and basic type safety
    try {
      if (json_config.contains("num_workers")) {
        config.num_workers = json_config.at("num_workers").get<int>();
      } else {
        config.num_workers = 1;
      }
    } catch (const std::exception&) {
      // Fallback to default if wrong type provided
      config.num_workers = 1;
    }

    config.validate();
    return config;
  }

  tome_core::ChunkingConfig chunking_config() const {
    tome_core::ChunkingConfig chunking;
    chunking.target_size = target_size;
    chunking.min_size = min_size;
    chunking.max_size = max_size;
    chunking.overlap_size = overlap_size;
    chunking.word_boundary_window = word_boundary_window;
    return chunking;
  }

  tome_core::PipelineOptions pipeline_options() const {
    return tome_core::PipelineOptions{clean_text, strip_repeated_lines, detect_tables};
  }

 private:
  void validate() const {
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    try {
      chunking_config().validate();
    } catch (const tome_core::IndexerError& e) {
      throw std::runtime_error(std::string("Invalid chunk sizes: ") + e.what());
    }
    for (const auto& keyword : extra_keywords) {
      if (keyword.empty()) {
        throw std::runtime_error("extra_keywords cannot contain empty terms");
      }
    }
  }
};
