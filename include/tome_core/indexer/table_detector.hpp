#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tome_core/types/rules_table.hpp"

namespace tome_core {

using TableLines = std::vector<std::string_view>;

// A table found by one strategy, in line coordinates of the scanned text.
struct TableCandidate {
  size_t start_line = 0;
  // Last line owned by the table (inclusive); nothing up to here is scanned again.
  size_t end_line = 0;
  std::string raw_text;
  std::optional<std::string> title_guess;
  std::string header_context;
  TableType type = TableType::Generic;
  Confidence confidence = Confidence::Low;
  std::vector<TableRow> parsed_rows;
};

/**
 * @brief One table layout: a cheap test on the trimmed line that may start a
 * table, and the parser run from that line.
 */
struct TableStrategy {
  TableType type;
  std::function<bool(std::string_view)> triggers;
  std::function<std::optional<TableCandidate>(const TableLines&, size_t)> detect;
};

/**
 * @class TableDetector
 * @brief Finds roll tables, stat lines, price lists and column layouts in
 * page text.
 *
 * Lines are scanned top to bottom. On each line not already owned by a table,
 * the strategies are tried in order and the first one that parses a table
 * wins.
 */
class TableDetector {
 public:
  // Uses default_strategies().
  TableDetector();
  explicit TableDetector(std::vector<TableStrategy> strategies);

  // roll table, stats table, equipment, generic.
  static std::vector<TableStrategy> default_strategies();

  std::vector<RulesTable> detect(std::string_view text, int page_number,
                                 const std::string& source_id,
                                 const std::optional<std::string>& section_id = std::nullopt) const;

  // Table type, long title words and well-known rules terms, deduplicated in order.
  static std::vector<std::string> extract_table_keywords(const TableCandidate& candidate);

  /**
   * @brief Gathers the rows of equipment, skill and injury tables into datasets.
   *
   * Low-confidence tables only contribute to the skills dataset. A dataset
   * with no rows is not emitted.
   */
  static std::vector<RulesDataset> detect_datasets(const std::vector<RulesTable>& tables,
                                                   const std::string& source_id);

  const std::vector<TableStrategy>& strategies() const {
    return strategies_;
  }

 private:
  std::vector<TableStrategy> strategies_;
};

// The default strategies, exposed for testing.
namespace table_detectors {
bool looks_like_roll_row(std::string_view line);
bool looks_like_stats_header(std::string_view line);
bool looks_like_price(std::string_view line);
bool looks_like_columns(std::string_view line);

std::optional<TableCandidate> detect_roll_table(const TableLines& lines, size_t start);
std::optional<TableCandidate> detect_stats_table(const TableLines& lines, size_t start);
std::optional<TableCandidate> detect_equipment_table(const TableLines& lines, size_t start);
std::optional<TableCandidate> detect_generic_table(const TableLines& lines, size_t start);
}  // namespace table_detectors

}  // namespace tome_core
