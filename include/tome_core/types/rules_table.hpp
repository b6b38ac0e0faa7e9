#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tome_core {

enum class Confidence { Low, Medium, High };

enum class TableType { RollTable, StatsTable, Equipment, Generic };

std::string to_string(Confidence confidence);
std::string to_string(TableType type);

// Column name to cell text.
using TableRow = std::map<std::string, std::string>;

/**
 * @brief A table recovered from page text, with the rows it could parse.
 */
struct RulesTable {
  std::string source_id;
  std::optional<std::string> section_id;
  std::optional<std::string> title_guess;
  // Up to three lines preceding the table.
  std::string header_context;
  int page_number = 1;
  std::string raw_text;
  std::vector<TableRow> parsed_rows;
  Confidence confidence = Confidence::Low;
  TableType type = TableType::Generic;
  std::vector<std::string> keywords;
};

struct DatasetRow {
  TableRow data;
  int page_number = 1;
};

// Rows of several tables gathered under one structured name (equipment, skills, ...).
struct RulesDataset {
  std::string source_id;
  std::string name;
  std::string dataset_type;
  std::vector<std::string> fields;
  Confidence confidence = Confidence::Low;
  std::vector<DatasetRow> rows;
};

}  // namespace tome_core
