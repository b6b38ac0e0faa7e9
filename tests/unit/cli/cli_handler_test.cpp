#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "tome_cli/cli_handler.hpp"

namespace tome_tests {

using namespace tome_cli;
namespace fs = std::filesystem;

class CliHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    temp_dir_ = fs::temp_directory_path() / ("tome_cli_test_" + std::to_string(rd()));
    fs::create_directories(temp_dir_);
    config_ = Config::from_json(nlohmann::json::object());
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(temp_dir_, ec);
  }

  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "tome_cli");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    return CliHandler::parse_arguments(static_cast<int>(argv.size()), argv.data());
  }

  std::string write_document(const std::string& name, const std::string& contents) {
    const fs::path path = temp_dir_ / name;
    std::ofstream(path) << contents;
    return path.string();
  }

  fs::path temp_dir_;
  Config config_;
};

TEST_F(CliHandlerTest, NoArgumentsMeansHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST_F(CliHandlerTest, ParsesIndexOptions) {
  auto options = parse({"index", "--file", "doc.json", "-o", "out.json", "--config", "tome.json"});

  EXPECT_EQ(options.command, Command::Index);
  EXPECT_EQ(options.file_path, "doc.json");
  EXPECT_EQ(options.output_path, "out.json");
  EXPECT_EQ(options.config_path, "tome.json");
}

TEST_F(CliHandlerTest, RejectsInvalidArguments) {
  EXPECT_THROW(parse({"index"}), CliError);
  EXPECT_THROW(parse({"index", "--file"}), CliError);
  EXPECT_THROW(parse({"index", "--file", "a.json", "--verbose", "yes"}), CliError);
  EXPECT_THROW(parse({"batch", "--dir", "docs"}), CliError);
  EXPECT_THROW(parse({"search", "--query", "x"}), CliError);
}

TEST_F(CliHandlerTest, ParsesBatchOptions) {
  auto options = parse({"b", "-d", "docs", "--output-dir", "out"});

  EXPECT_EQ(options.command, Command::Batch);
  EXPECT_EQ(options.directory, "docs");
  EXPECT_EQ(options.output_directory, "out");
}

TEST_F(CliHandlerTest, HelpPrintsUsage) {
  std::ostringstream out;
  CliHandler handler(config_, out);

  EXPECT_EQ(handler.execute_command(CliOptions{}), 0);
  EXPECT_NE(out.str().find("Usage:"), std::string::npos);
}

TEST_F(CliHandlerTest, LoadDocumentDefaultsSourceIdToFileStem) {
  auto path = write_document("mordheim.json",
                             R"({"pages": [{"text": "COMBAT", "page_number": 1}]})");

  auto document = CliHandler::load_document(path);

  EXPECT_EQ(document.source_id, "mordheim");
  ASSERT_EQ(document.pages.size(), 1u);
}

TEST_F(CliHandlerTest, LoadDocumentReportsBadInput) {
  EXPECT_THROW(CliHandler::load_document((temp_dir_ / "missing.json").string()), CliError);
  EXPECT_THROW(CliHandler::load_document(write_document("broken.json", "{")), CliError);
  EXPECT_THROW(CliHandler::load_document(write_document("nopages.json", R"({"source_id": "x"})")),
               CliError);
}

TEST_F(CliHandlerTest, IndexWritesResultJson) {
  auto path = write_document(
      "doc.json",
      R"({"source_id": "mordheim", "pages": [{"text": "COMBAT\n\nRoll 1d6 to hit.", "page_number": 7}]})");
  std::ostringstream out;
  CliHandler handler(config_, out);

  CliOptions options;
  options.command = Command::Index;
  options.file_path = path;
  ASSERT_EQ(handler.execute_command(options), 0);

  auto result = nlohmann::json::parse(out.str());
  EXPECT_EQ(result.at("source_id"), "mordheim");
  ASSERT_EQ(result.at("sections").size(), 1u);
  ASSERT_EQ(result.at("chunks").size(), 1u);
  EXPECT_EQ(result.at("chunks")[0].at("page_start"), 7);
  EXPECT_EQ(result.at("chunks")[0].at("score_hints").at("hasDiceNotation"), true);
}

TEST_F(CliHandlerTest, IndexFailsOnInvalidPages) {
  auto path = write_document(
      "doc.json", R"({"source_id": "bad", "pages": [{"text": "x", "page_number": 0}]})");
  std::ostringstream out;
  CliHandler handler(config_, out);

  CliOptions options;
  options.command = Command::Index;
  options.file_path = path;

  EXPECT_EQ(handler.execute_command(options), 1);
  EXPECT_TRUE(out.str().empty());
}

TEST_F(CliHandlerTest, BatchWritesOneFilePerDocument) {
  const fs::path input_dir = temp_dir_ / "in";
  const fs::path output_dir = temp_dir_ / "out";
  fs::create_directories(input_dir);
  std::ofstream(input_dir / "a.json")
      << R"({"pages": [{"text": "COMBAT\n\nRoll to hit.", "page_number": 1}]})";
  std::ofstream(input_dir / "b.json")
      << R"({"pages": [{"text": "Combat Rules. Roll 1d6 to hit.", "page_number": 1}]})";
  std::ofstream(input_dir / "notes.txt") << "ignored";

  std::ostringstream out;
  CliHandler handler(config_, out);
  CliOptions options;
  options.command = Command::Batch;
  options.directory = input_dir.string();
  options.output_directory = output_dir.string();

  ASSERT_EQ(handler.execute_command(options), 0);

  ASSERT_TRUE(fs::exists(output_dir / "a.index.json"));
  ASSERT_TRUE(fs::exists(output_dir / "b.index.json"));
  std::ifstream b_stream(output_dir / "b.index.json");
  auto b_result = nlohmann::json::parse(b_stream);
  EXPECT_EQ(b_result.at("source_id"), "b");
  EXPECT_TRUE(b_result.at("sections").empty());
}

TEST_F(CliHandlerTest, BatchRejectsMissingDirectory) {
  std::ostringstream out;
  CliHandler handler(config_, out);
  CliOptions options;
  options.command = Command::Batch;
  options.directory = (temp_dir_ / "nowhere").string();
  options.output_path = (temp_dir_ / "all.json").string();

  EXPECT_THROW(handler.execute_command(options), CliError);
}

}  // namespace tome_tests
