#include "tome_cli/cli_handler.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "tome_core/indexer/keyword_extractor.hpp"
#include "tome_core/indexer/score_hint_analyzer.hpp"
#include "tome_core/serialization/json_codec.hpp"

namespace fs = std::filesystem;

namespace tome_cli {

namespace {

// Parses "--flag value" pairs starting at argv[2].
void parse_flags(int argc, char* argv[], CliOptions& options) {
    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[i + 1];

        if (flag == "--file" || flag == "-f") {
            options.file_path = value;
        } else if (flag == "--dir" || flag == "-d") {
            options.directory = value;
        } else if (flag == "--output" || flag == "-o") {
            options.output_path = value;
        } else if (flag == "--output-dir") {
            options.output_directory = value;
        } else if (flag == "--config" || flag == "-c") {
            options.config_path = value;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }
}

}  // namespace

CliHandler::CliHandler(const Config& config, std::ostream& out)
    : config_(config), out_(out) {
    pipeline_ = std::make_shared<const tome_core::IndexingPipeline>(
        config_.chunking_config(), config_.pipeline_options(),
        std::make_shared<const tome_core::KeywordExtractor>(
            tome_core::KeywordExtractor::with_extra_terms(config_.extra_keywords)),
        std::make_shared<const tome_core::ScoreHintAnalyzer>());
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "index" || command == "i") {
        options.command = Command::Index;
        parse_flags(argc, argv, options);
        if (options.file_path.empty()) {
            throw CliError("Index command requires a document. Usage: index --file <document.json>");
        }
    } else if (command == "batch" || command == "b") {
        options.command = Command::Batch;
        parse_flags(argc, argv, options);
        if (options.directory.empty()) {
            throw CliError("Batch command requires a directory. Usage: batch --dir <directory>");
        }
        // Workers log to stdout, so batch results always go to files.
        if (options.output_path.empty() && options.output_directory.empty()) {
            throw CliError("Batch command requires --output <path> or --output-dir <directory>");
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Index:
            return handle_index_command(options);
        case Command::Batch:
            return handle_batch_command(options);
        case Command::Help:
            return handle_help_command();
    }
    return handle_help_command();
}

tome_core::SourceDocument CliHandler::load_document(const std::string& path) {
    std::ifstream file_stream(path);
    if (!file_stream.is_open()) {
        throw CliError("Could not open document: " + path);
    }

    nlohmann::json json_document;
    try {
        file_stream >> json_document;
    } catch (const std::exception& e) {
        throw CliError("Failed to parse JSON in '" + path + "': " + e.what());
    }

    if (!json_document.contains("source_id")) {
        json_document["source_id"] = fs::path(path).stem().string();
    }

    try {
        return json_document.get<tome_core::SourceDocument>();
    } catch (const nlohmann::json::exception& e) {
        throw CliError("Malformed document '" + path + "': " + e.what());
    }
}

int CliHandler::handle_index_command(const CliOptions& options) {
    tome_core::BatchIndexingService service(pipeline_, 1);
    tome_core::IndexingOutcome outcome = service.index_one(load_document(options.file_path));
    if (!outcome.succeeded()) {
        std::cerr << "Error: " << *outcome.error << std::endl;
        return 1;
    }

    write_json(nlohmann::json(*outcome.result), options.output_path);
    std::cerr << "Indexed " << outcome.source_id << ": " << outcome.result->sections.size()
              << " sections, " << outcome.result->chunks.size() << " chunks, "
              << outcome.result->tables.size() << " tables." << std::endl;
    return 0;
}

int CliHandler::handle_batch_command(const CliOptions& options) {
    const std::vector<std::string> paths = list_documents(options.directory);
    if (paths.empty()) {
        std::cerr << "No .json documents found in " << options.directory << std::endl;
        return 0;
    }

    std::vector<tome_core::SourceDocument> documents;
    documents.reserve(paths.size());
    for (const auto& path : paths) {
        documents.push_back(load_document(path));
    }

    tome_core::BatchIndexingService service(pipeline_, static_cast<size_t>(config_.num_workers));
    std::vector<tome_core::IndexingOutcome> outcomes = service.index_all(std::move(documents));

    int failures = 0;
    nlohmann::json combined = nlohmann::json::array();
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const auto& outcome = outcomes[i];
        if (!outcome.succeeded()) {
            ++failures;
            std::cerr << "FAILED " << outcome.source_id << ": " << *outcome.error << std::endl;
            continue;
        }
        if (options.output_directory.empty()) {
            combined.push_back(*outcome.result);
        } else {
            fs::create_directories(options.output_directory);
            const fs::path target = fs::path(options.output_directory) /
                                    (fs::path(paths[i]).stem().string() + ".index.json");
            write_json(nlohmann::json(*outcome.result), target.string());
        }
    }

    if (options.output_directory.empty()) {
        write_json(combined, options.output_path);
    }
    std::cerr << "Indexed " << outcomes.size() - failures << " of " << outcomes.size()
              << " documents." << std::endl;
    return failures == 0 ? 0 : 1;
}

int CliHandler::handle_help_command() {
    out_ << "tome - rulebook section and chunk indexer\n\n"
         << "Usage:\n"
         << "  tome_cli index --file <document.json> [--output <path>]\n"
         << "  tome_cli batch --dir <directory> (--output <path> | --output-dir <directory>)\n"
         << "  tome_cli help\n\n"
         << "Options:\n"
         << "  --config <path>   JSON config (defaults to $TOME_CONFIG)\n\n"
         << "A document is {\"source_id\": str, \"pages\": [{\"text\": str, \"page_number\": int}]}.\n";
    return 0;
}

void CliHandler::write_json(const nlohmann::json& value, const std::string& path) {
    if (path.empty()) {
        out_ << value.dump(2) << std::endl;
        return;
    }
    std::ofstream file_stream(path);
    if (!file_stream.is_open()) {
        throw CliError("Could not write output file: " + path);
    }
    file_stream << value.dump(2) << std::endl;
}

std::vector<std::string> CliHandler::list_documents(const std::string& directory) {
    if (!fs::is_directory(directory)) {
        throw CliError("Not a directory: " + directory);
    }
    std::vector<std::string> paths;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            paths.push_back(entry.path().string());
        }
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

}  // namespace tome_cli
