#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tome_cli/config.hpp"
#include "tome_core/services/batch_indexing_service.hpp"

namespace tome_cli
{

  enum class Command
  {
    Index,
    Batch,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string directory;
    std::string output_path;
    std::string output_directory;
    std::string config_path;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    CliHandler(const Config &config, std::ostream &out);

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command; returns the process exit code
    int execute_command(const CliOptions &options);

    // Reads a {"source_id", "pages"} document; source_id defaults to the file stem
    static tome_core::SourceDocument load_document(const std::string &path);

  private:
    Config config_;
    std::ostream &out_;
    std::shared_ptr<const tome_core::IndexingPipeline> pipeline_;

    // Command handlers
    int handle_index_command(const CliOptions &options);
    int handle_batch_command(const CliOptions &options);
    int handle_help_command();

    void write_json(const nlohmann::json &value, const std::string &path);
    static std::vector<std::string> list_documents(const std::string &directory);
  };

}
