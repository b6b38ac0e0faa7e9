#include "tome_core/indexer/table_detector.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "tome_core/utils/text_utils.hpp"

namespace tome_core {

namespace {

constexpr size_t kMinRollRows = 3;
constexpr size_t kMinEquipmentRows = 3;
constexpr size_t kMinStatsHeaders = 3;
constexpr size_t kMinGenericColumns = 2;
constexpr size_t kMinGenericRows = 2;

constexpr size_t kRollTitleLookback = 5;
constexpr size_t kShortTitleLookback = 3;
constexpr size_t kMaxTitleLength = 60;

constexpr size_t kEquipmentScanLines = 30;
constexpr size_t kStatsScanLines = 20;
constexpr size_t kGenericScanLines = 30;

constexpr const char* kEnDash = "\xE2\x80\x93";

const std::string& dash() {
  static const std::string alternatives = std::string("(?:-|") + kEnDash + ")";
  return alternatives;
}

const std::regex& roll_range_row_regex() {
  static const std::regex re(R"(^(\d+)\s*)" + dash() + R"(\s*(\d+)[:\s]+(.+)$)");
  return re;
}

const std::regex& roll_single_row_regex() {
  static const std::regex re(R"(^(\d+)[:\s]+(.+)$)");
  return re;
}

const std::regex& roll_d66_row_regex() {
  static const std::regex re(R"(^(\d{2})\s*)" + dash() + R"(?\s*(.+)$)");
  return re;
}

const std::regex& roll_trigger_regex() {
  static const std::regex re(std::string(R"(^\d+\s*(?:-|:|)") + kEnDash + R"()\s*\d*)");
  return re;
}

const std::regex& die_face_trigger_regex() {
  static const std::regex re(R"(^[1-6]\s*)" + dash() + R"(?\s*[1-6]?\s*[:\s])");
  return re;
}

const std::regex& stats_trigger_regex() {
  static const std::regex re(R"(\b(?:M|WS|BS|S|T|W|I|A|Ld)\b)", std::regex::icase);
  return re;
}

const std::regex& stat_header_regex() {
  static const std::regex re(R"(\b(?:M|WS|BS|S|T|W|I|A|Ld|Sv|Mv|Rng|Acc|Str|AP|Dmg)\b)",
                             std::regex::icase);
  return re;
}

const std::regex& price_regex() {
  static const std::regex re(R"(\d+\s*(?:gc|gold|pts?|points?))", std::regex::icase);
  return re;
}

const std::regex& priced_item_regex() {
  static const std::regex re(R"(^(.+?)\s+(\d+)\s*(gc|gold|pts?|points?)(\s+.+)?$)",
                             std::regex::icase);
  return re;
}

const std::regex& dashed_price_regex() {
  static const std::regex re(R"(^(.+?)\s*)" + dash() + R"(\s*(\d+)\s*(gc|gold|pts?)$)",
                             std::regex::icase);
  return re;
}

const std::regex& equipment_title_regex() {
  static const std::regex re(R"(equipment|weapon|armour|armor|item|gear)", std::regex::icase);
  return re;
}

const std::regex& stats_separator_regex() {
  static const std::regex re(R"(\s{2,}|\t)");
  return re;
}

const std::regex& tab_separator_regex() {
  static const std::regex re(R"(\t+)");
  return re;
}

const std::regex& space_separator_regex() {
  static const std::regex re(R"(\s{3,})");
  return re;
}

bool search(std::string_view text, const std::regex& re) {
  return std::regex_search(text.begin(), text.end(), re);
}

bool starts_with_digit(std::string_view line) {
  return !line.empty() && std::isdigit(static_cast<unsigned char>(line.front()));
}

// Trimmed, non-empty cells of a line.
std::vector<std::string> split_columns(std::string_view line, const std::regex& separator) {
  using svregex_token_iterator = std::regex_token_iterator<std::string_view::const_iterator>;
  std::vector<std::string> columns;
  for (auto it = svregex_token_iterator(line.begin(), line.end(), separator, -1);
       it != svregex_token_iterator(); ++it) {
    std::string cell = text_utils::trim(
        line.substr(static_cast<size_t>(it->first - line.begin()), static_cast<size_t>(it->length())));
    if (!cell.empty()) {
      columns.push_back(std::move(cell));
    }
  }
  return columns;
}

TableRow make_row(const std::vector<std::string>& headers, const std::vector<std::string>& values) {
  TableRow row;
  for (size_t i = 0; i < headers.size(); ++i) {
    row[headers[i]] = i < values.size() ? values[i] : std::string();
  }
  return row;
}

// Lines [begin, end) joined with '\n'; end is clamped to the line count.
std::string join_lines(const TableLines& lines, size_t begin, size_t end) {
  end = std::min(end, lines.size());
  std::string joined;
  for (size_t i = begin; i < end; ++i) {
    if (i > begin) {
      joined.push_back('\n');
    }
    joined.append(lines[i]);
  }
  return joined;
}

size_t back_off(size_t index, size_t distance) {
  return index > distance ? index - distance : 0;
}

// Nearest of the `lookback` lines above `start` accepted by the predicate.
std::optional<std::string> find_title(const TableLines& lines, size_t start, size_t lookback,
                                      const std::function<bool(std::string_view)>& accepts) {
  for (size_t i = start; i > back_off(start, lookback); --i) {
    std::string_view line = text_utils::trim_view(lines[i - 1]);
    if (!line.empty() && accepts(line)) {
      return std::string(line);
    }
  }
  return std::nullopt;
}

void append_unique(std::vector<std::string>& keywords, std::string keyword) {
  if (std::find(keywords.begin(), keywords.end(), keyword) == keywords.end()) {
    keywords.push_back(std::move(keyword));
  }
}

const std::vector<std::string>& table_terms() {
  static const std::vector<std::string> terms = {
      "injury",    "exploration", "advancement", "skill",  "loot",
      "encounter", "event",       "critical",    "fumble", "misfire",
      "weapon",    "armour",      "armor",       "equipment", "spell",
  };
  return terms;
}

bool has_keyword(const RulesTable& table, const std::string& keyword) {
  return std::find(table.keywords.begin(), table.keywords.end(), keyword) != table.keywords.end();
}

// Collects the rows of every table accepted by the filter. Returns nullopt
// when no row was collected.
std::optional<RulesDataset> gather_dataset(const std::vector<RulesTable>& tables,
                                           const std::function<bool(const RulesTable&)>& accepts,
                                           RulesDataset dataset, bool collect_fields) {
  for (const auto& table : tables) {
    if (!accepts(table)) {
      continue;
    }
    for (const auto& row : table.parsed_rows) {
      if (collect_fields) {
        for (const auto& cell : row) {
          append_unique(dataset.fields, cell.first);
        }
      }
      dataset.rows.push_back(DatasetRow{row, table.page_number});
    }
  }
  if (dataset.rows.empty()) {
    return std::nullopt;
  }
  return dataset;
}

}  // namespace

std::string to_string(Confidence confidence) {
  switch (confidence) {
    case Confidence::Low:
      return "low";
    case Confidence::Medium:
      return "medium";
    case Confidence::High:
      return "high";
  }
  return "unknown";
}

std::string to_string(TableType type) {
  switch (type) {
    case TableType::RollTable:
      return "roll_table";
    case TableType::StatsTable:
      return "stats_table";
    case TableType::Equipment:
      return "equipment";
    case TableType::Generic:
      return "generic";
  }
  return "unknown";
}

namespace table_detectors {

bool looks_like_roll_row(std::string_view line) {
  return search(line, roll_trigger_regex()) || search(line, die_face_trigger_regex());
}

bool looks_like_stats_header(std::string_view line) {
  return search(line, stats_trigger_regex());
}

bool looks_like_price(std::string_view line) {
  return search(line, price_regex());
}

bool looks_like_columns(std::string_view line) {
  return line.find('\t') != std::string_view::npos || search(line, space_separator_regex());
}

std::optional<TableCandidate> detect_roll_table(const TableLines& lines, size_t start) {
  auto title = find_title(lines, start, kRollTitleLookback, [](std::string_view line) {
    return !starts_with_digit(line) && line.size() < kMaxTitleLength;
  });

  std::optional<size_t> table_start;
  std::vector<TableRow> rows;
  for (size_t i = start; i < lines.size(); ++i) {
    std::string_view line = text_utils::trim_view(lines[i]);
    if (line.empty()) {
      if (rows.size() >= kMinRollRows) {
        break;
      }
      continue;
    }

    std::match_results<std::string_view::const_iterator> match;
    bool matched = true;
    if (std::regex_match(line.begin(), line.end(), match, roll_range_row_regex())) {
      rows.push_back({{"Roll", match.str(1) + "-" + match.str(2)},
                      {"Result", text_utils::trim(match.str(3))}});
    } else if (std::regex_match(line.begin(), line.end(), match, roll_single_row_regex()) ||
               std::regex_match(line.begin(), line.end(), match, roll_d66_row_regex())) {
      rows.push_back({{"Roll", match.str(1)}, {"Result", text_utils::trim(match.str(2))}});
    } else {
      matched = false;
    }

    if (matched) {
      if (!table_start) {
        table_start = i;
      }
      continue;
    }
    if (!table_start) {
      continue;
    }
    // A wrapped result continues on a line without a roll number.
    if (!starts_with_digit(line) && !rows.empty()) {
      rows.back()["Result"] += " " + std::string(line);
    } else if (rows.size() >= kMinRollRows) {
      break;
    }
  }

  if (rows.size() < kMinRollRows) {
    return std::nullopt;
  }

  static const std::regex two_digits(R"(^\d{2}$)");
  const bool has_d6 = rows.size() == 6 || std::any_of(rows.begin(), rows.end(), [](const TableRow& row) {
                        return row.at("Roll").find('-') != std::string::npos;
                      });
  const bool has_d66 = std::any_of(rows.begin(), rows.end(), [](const TableRow& row) {
    return std::regex_match(row.at("Roll"), two_digits);
  });

  TableCandidate candidate;
  candidate.start_line = *table_start;
  candidate.end_line = *table_start + rows.size();
  candidate.raw_text = join_lines(lines, back_off(*table_start, 2), *table_start + rows.size() + 1);
  candidate.title_guess = title ? *title : (has_d66 ? "D66 Table" : "D6 Table");
  candidate.header_context = join_lines(lines, back_off(*table_start, 3), *table_start);
  candidate.type = TableType::RollTable;
  candidate.confidence = has_d6 || has_d66 ? Confidence::High : Confidence::Medium;
  candidate.parsed_rows = std::move(rows);
  return candidate;
}

std::optional<TableCandidate> detect_stats_table(const TableLines& lines, size_t start) {
  std::string_view header_line = text_utils::trim_view(lines[start]);
  if (!search(header_line, stat_header_regex())) {
    return std::nullopt;
  }

  const auto headers = split_columns(header_line, stats_separator_regex());
  if (headers.size() < kMinStatsHeaders) {
    return std::nullopt;
  }

  auto title = find_title(lines, start, kShortTitleLookback, [](std::string_view line) {
    return !search(line, stat_header_regex()) && line.size() < kMaxTitleLength;
  });

  std::vector<TableRow> rows;
  const size_t scan_end = std::min(lines.size(), start + kStatsScanLines);
  for (size_t i = start + 1; i < scan_end; ++i) {
    std::string_view line = text_utils::trim_view(lines[i]);
    if (line.empty()) {
      if (!rows.empty()) {
        break;
      }
      continue;
    }

    const auto values = split_columns(line, stats_separator_regex());
    if (values.size() + 1 >= headers.size()) {
      rows.push_back(make_row(headers, values));
    } else if (!rows.empty()) {
      break;
    }
  }

  if (rows.empty()) {
    return std::nullopt;
  }

  TableCandidate candidate;
  candidate.start_line = start;
  candidate.end_line = start + rows.size() + 1;
  candidate.raw_text = join_lines(lines, back_off(start, 2), start + rows.size() + 2);
  candidate.title_guess = title ? *title : "Stats Table";
  candidate.header_context = join_lines(lines, back_off(start, 3), start);
  candidate.type = TableType::StatsTable;
  candidate.confidence = Confidence::High;
  candidate.parsed_rows = std::move(rows);
  return candidate;
}

std::optional<TableCandidate> detect_equipment_table(const TableLines& lines, size_t start) {
  auto title = find_title(lines, start, kShortTitleLookback, [](std::string_view line) {
    return search(line, equipment_title_regex());
  });

  std::optional<size_t> table_start;
  std::vector<TableRow> rows;
  const size_t scan_end = std::min(lines.size(), start + kEquipmentScanLines);
  for (size_t i = start; i < scan_end; ++i) {
    std::string_view line = text_utils::trim_view(lines[i]);
    if (line.empty()) {
      if (rows.size() >= kMinEquipmentRows) {
        break;
      }
      continue;
    }

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_match(line.begin(), line.end(), match, priced_item_regex()) ||
        std::regex_match(line.begin(), line.end(), match, dashed_price_regex())) {
      if (!table_start) {
        table_start = i;
      }
      const std::string effect = match.size() > 4 && match[4].matched ? match.str(4) : "";
      rows.push_back({{"Name", text_utils::trim(match.str(1))},
                      {"Cost", match.str(2) + " " + match.str(3)},
                      {"Effect", text_utils::trim(effect)}});
    }
  }

  if (rows.size() < kMinEquipmentRows) {
    return std::nullopt;
  }

  TableCandidate candidate;
  candidate.start_line = *table_start;
  candidate.end_line = *table_start + rows.size();
  candidate.raw_text = join_lines(lines, back_off(*table_start, 2), *table_start + rows.size() + 1);
  candidate.title_guess = title ? *title : "Equipment";
  candidate.header_context = join_lines(lines, back_off(*table_start, 3), *table_start);
  candidate.type = TableType::Equipment;
  candidate.confidence = Confidence::Medium;
  candidate.parsed_rows = std::move(rows);
  return candidate;
}

std::optional<TableCandidate> detect_generic_table(const TableLines& lines, size_t start) {
  std::string_view header_line = text_utils::trim_view(lines[start]);
  const std::regex& separator = header_line.find('\t') != std::string_view::npos
                                    ? tab_separator_regex()
                                    : space_separator_regex();

  const auto headers = split_columns(header_line, separator);
  if (headers.size() < kMinGenericColumns) {
    return std::nullopt;
  }

  std::vector<TableRow> rows;
  const size_t scan_end = std::min(lines.size(), start + kGenericScanLines);
  for (size_t i = start + 1; i < scan_end; ++i) {
    std::string_view line = text_utils::trim_view(lines[i]);
    if (line.empty()) {
      if (rows.size() >= kMinGenericRows) {
        break;
      }
      continue;
    }

    const auto values = split_columns(line, separator);
    if (values.size() + 1 >= headers.size()) {
      rows.push_back(make_row(headers, values));
    } else if (rows.size() >= kMinGenericRows) {
      break;
    }
  }

  if (rows.size() < kMinGenericRows) {
    return std::nullopt;
  }

  TableCandidate candidate;
  candidate.start_line = start;
  candidate.end_line = start + rows.size() + 1;
  candidate.raw_text = join_lines(lines, start, start + rows.size() + 1);
  candidate.header_context = join_lines(lines, back_off(start, 2), start);
  candidate.type = TableType::Generic;
  candidate.confidence = Confidence::Low;
  candidate.parsed_rows = std::move(rows);
  return candidate;
}

}  // namespace table_detectors

TableDetector::TableDetector() : strategies_(default_strategies()) {}

TableDetector::TableDetector(std::vector<TableStrategy> strategies)
    : strategies_(std::move(strategies)) {}

std::vector<TableStrategy> TableDetector::default_strategies() {
  return {
      {TableType::RollTable, table_detectors::looks_like_roll_row, table_detectors::detect_roll_table},
      {TableType::StatsTable, table_detectors::looks_like_stats_header,
       table_detectors::detect_stats_table},
      {TableType::Equipment, table_detectors::looks_like_price,
       table_detectors::detect_equipment_table},
      {TableType::Generic, table_detectors::looks_like_columns, table_detectors::detect_generic_table},
  };
}

std::vector<RulesTable> TableDetector::detect(std::string_view text, int page_number,
                                              const std::string& source_id,
                                              const std::optional<std::string>& section_id) const {
  std::vector<RulesTable> tables;
  const TableLines lines = text_utils::split_lines(text);
  std::vector<bool> processed(lines.size(), false);

  for (size_t i = 0; i < lines.size(); ++i) {
    if (processed[i]) {
      continue;
    }
    std::string_view line = text_utils::trim_view(lines[i]);
    if (line.empty()) {
      continue;
    }

    std::optional<TableCandidate> candidate;
    for (const auto& strategy : strategies_) {
      if (strategy.triggers(line)) {
        candidate = strategy.detect(lines, i);
        if (candidate) {
          break;
        }
      }
    }
    if (!candidate) {
      continue;
    }

    for (size_t j = candidate->start_line; j <= candidate->end_line && j < lines.size(); ++j) {
      processed[j] = true;
    }

    RulesTable table;
    table.source_id = source_id;
    table.section_id = section_id;
    table.title_guess = candidate->title_guess;
    table.header_context = candidate->header_context;
    table.page_number = page_number;
    table.raw_text = candidate->raw_text;
    table.confidence = candidate->confidence;
    table.type = candidate->type;
    table.keywords = extract_table_keywords(*candidate);
    table.parsed_rows = std::move(candidate->parsed_rows);
    tables.push_back(std::move(table));
  }

  return tables;
}

std::vector<std::string> TableDetector::extract_table_keywords(const TableCandidate& candidate) {
  std::vector<std::string> keywords;

  std::string type_name = to_string(candidate.type);
  if (auto underscore = type_name.find('_'); underscore != std::string::npos) {
    type_name[underscore] = ' ';
  }
  append_unique(keywords, type_name);

  if (candidate.title_guess) {
    static const std::regex whitespace(R"(\s+)");
    const std::string title = text_utils::to_lower(*candidate.title_guess);
    for (auto it = std::sregex_token_iterator(title.begin(), title.end(), whitespace, -1);
         it != std::sregex_token_iterator(); ++it) {
      if (it->length() > 3) {
        append_unique(keywords, it->str());
      }
    }
  }

  const std::string raw_lower = text_utils::to_lower(candidate.raw_text);
  for (const auto& term : table_terms()) {
    if (raw_lower.find(term) != std::string::npos) {
      append_unique(keywords, term);
    }
  }

  return keywords;
}

std::vector<RulesDataset> TableDetector::detect_datasets(const std::vector<RulesTable>& tables,
                                                         const std::string& source_id) {
  std::vector<RulesDataset> datasets;

  auto equipment = gather_dataset(
      tables,
      [](const RulesTable& table) {
        return has_keyword(table, "equipment") && table.confidence != Confidence::Low;
      },
      RulesDataset{source_id, "Equipment", "equipment", {}, Confidence::High, {}}, true);
  if (equipment) {
    datasets.push_back(std::move(*equipment));
  }

  auto skills = gather_dataset(
      tables, [](const RulesTable& table) { return has_keyword(table, "skill"); },
      RulesDataset{source_id, "Skills", "skills", {}, Confidence::Medium, {}}, true);
  if (skills) {
    datasets.push_back(std::move(*skills));
  }

  auto injuries = gather_dataset(
      tables,
      [](const RulesTable& table) {
        return has_keyword(table, "injury") && table.confidence != Confidence::Low;
      },
      RulesDataset{source_id, "Injuries", "injuries", {"Roll", "Result"}, Confidence::High, {}},
      false);
  if (injuries) {
    datasets.push_back(std::move(*injuries));
  }

  return datasets;
}

}  // namespace tome_core
