#ifndef INKPRESS_CLI_PARSER_HPP
#define INKPRESS_CLI_PARSER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include "../../../libinkpress/include/epub_pipeline.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::filesystem::path input;
    std::filesystem::path output;

    std::size_t max_title_length = inkpress::kDefaultMaxTitleLength;
    std::size_t skip_pages = inkpress::kDefaultSkipPages;
    std::filesystem::path stylesheet;
    bool keep_images = false;

    std::string run_id = "local";
    std::string git_sha = "unknown";

    bool debug = false;
    bool quiet = false;
    std::string log_level = "INFO";
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    [[nodiscard]] inkpress::PipelineOptions to_pipeline_options() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 *
 * Options with an environment fallback read it when absent from the command
 * line: INKPRESS_MAX_TITLE_LENGTH, INKPRESS_STYLESHEET, WORKFLOW_RUN_ID,
 * GIT_SHA and BLOOMBERG_DEBUG.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // INKPRESS_CLI_PARSER_HPP
