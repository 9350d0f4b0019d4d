#include "cli_parser.hpp"
#include "../../../libinkpress/include/version.hpp"
#include <CLI/CLI.hpp>

inkpress::PipelineOptions Settings::to_pipeline_options() const {
    inkpress::PipelineOptions options;
    options.max_title_length = max_title_length;
    options.skip_leading_pages = skip_pages;
    if (!stylesheet.empty()) {
        options.stylesheet = stylesheet;
    }
    options.strip_images = !keep_images;
    options.debug = debug;
    options.provenance.workflow_run_id = run_id;
    options.provenance.git_sha = git_sha;
    return options;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", INKPRESS_VERSION);

    // --- Positional Arguments ---
    // existence is left to the pipeline (InvalidInput)
    app.add_option("input", settings.input, "EPUB produced by the upstream generator.")
        ->required();

    app.add_option("output", settings.output, "Destination EPUB (parent directories are created).")
        ->required();

    // --- Transformation ---
    app.add_option("--max-title-length", settings.max_title_length,
                   "Maximum displayed length of navigation titles.")
        ->envname("INKPRESS_MAX_TITLE_LENGTH")
        ->default_val(inkpress::kDefaultMaxTitleLength)
        ->check(CLI::Range(inkpress::kMinTitleLength, static_cast<std::size_t>(100000)));

    app.add_option("--skip-pages", settings.skip_pages,
                   "Leading spine entries to drop (cover and index pages).")
        ->default_val(inkpress::kDefaultSkipPages)
        ->check(CLI::NonNegativeNumber);

    app.add_option("--stylesheet", settings.stylesheet,
                   "Replacement CSS copied into the package as stylesheet.css.")
        ->envname("INKPRESS_STYLESHEET");

    app.add_flag("--keep-images", settings.keep_images,
                 "Keep images and their references.");

    // --- Provenance ---
    app.add_option("--run-id", settings.run_id, "Workflow run identifier for the diagnostics record.")
        ->envname("WORKFLOW_RUN_ID")
        ->default_val("local");

    app.add_option("--git-sha", settings.git_sha, "Commit identifier for the diagnostics record.")
        ->envname("GIT_SHA")
        ->default_val("unknown");

    // --- Logging ---
    app.add_flag("--debug", settings.debug,
                 "Log every title rewrite and record debug mode in the diagnostics.")
        ->envname("BLOOMBERG_DEBUG");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress console logging and the run summary.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("INFO")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to a file (default: no file logging).");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last(); // if used multiple times, take the last one

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        std::error_code ec;
        if (std::filesystem::equivalent(settings.input, settings.output, ec)) {
            throw CLI::ValidationError("Output must differ from the input file.");
        }
        if (!settings.stylesheet.empty() && std::filesystem::is_directory(settings.stylesheet, ec)) {
            throw CLI::ValidationError("--stylesheet must name a file, not a directory.");
        }
    });
}
