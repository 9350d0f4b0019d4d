#include <chrono>
#include <clocale>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libinkpress/include/epub_pipeline.hpp"
#include "../../libinkpress/include/event_bus.hpp"
#include "../../libinkpress/include/events.hpp"
#include "../../libinkpress/include/logger.hpp"

using namespace inkpress;
namespace fs = std::filesystem;

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII titles may be problematic.",
                "LocaleInit");
}

// prints "[ n/11] Stage" lines as the pipeline advances
static void subscribe_progress(EventBus& bus) {
    constexpr int stage_count = static_cast<int>(PipelineStage::Finalize) + 1;

    bus.subscribe<StageCompleteEvent>([](const StageCompleteEvent& e) {
        std::cerr << CYAN << "[" << std::setw(2) << static_cast<int>(e.stage) + 1 << "/" << stage_count << "] "
                  << RESET << std::left << std::setw(18) << stage_to_string(e.stage) << std::right
                  << (e.skipped ? " skipped" : " " + std::to_string(e.duration.count()) + " ms")
                  << std::endl;
    });

    bus.subscribe<WarningEvent>([](const WarningEvent& e) {
        std::cerr << YELLOW << "[WARN] " << warning_kind_to_string(e.warning.kind) << ": "
                  << e.warning.message << RESET << std::endl;
    });
}

int main(int argc, char* argv[]) {

    CLI::App app{"inkpress: EPUB post-processor for e-ink readers."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    // set loggers
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        try {
            Logger::add_sink(std::make_unique<FileLogSink>(settings.log_file, false));
        } catch (const std::exception& e) {
            std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
            return 1;
        }
    }

    if (!settings.quiet && (settings.debug || settings.log_level != "NONE")) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = settings.debug ? LogLevel::Debug : Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    if (settings.debug) {
        Logger::log(LogLevel::Debug, "Debug mode enabled", "main");
    }

    EventBus bus;
    if (!settings.quiet) {
        subscribe_progress(bus);
    }

    const auto start_total = std::chrono::steady_clock::now();
    const auto seconds_since_start = [&start_total] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();
    };

    Result report;
    int exit_code = 0;
    try {
        EpubPipeline pipeline(settings.to_pipeline_options(), bus);
        report = make_result(pipeline.process(settings.input, settings.output));
    } catch (const InkpressError& e) {
        std::cerr << RED << "Error [" << error_kind_to_string(e.kind()) << "]: " << e.what() << RESET << std::endl;
        report = make_failed_result(settings.input, settings.output, error_kind_to_string(e.kind()), e.what(),
                                    seconds_since_start());
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        report = make_failed_result(settings.input, settings.output, "Error", e.what(), seconds_since_start());
        exit_code = 1;
    }

    if (!settings.quiet && exit_code == 0) {
        print_console_report(report);
    }

    // export CSV if requested
    if (!settings.report_path.empty() && !export_csv_report(report, settings.report_path)) {
        Logger::log(LogLevel::Error, "Failed to write report: " + settings.report_path.string(), "main");
        std::cerr << RED << "Error: cannot write report " << settings.report_path.string() << RESET << std::endl;
        if (exit_code == 0) exit_code = 1;
    }

    return exit_code;
}
