#ifndef INKPRESS_REPORT_GENERATOR_HPP
#define INKPRESS_REPORT_GENERATOR_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../../../libinkpress/include/epub_pipeline.hpp"

struct Result {
    std::filesystem::path input;
    std::filesystem::path output;
    uintmax_t size_before{};           // input size in bytes
    uintmax_t size_after{};            // output size in bytes
    bool success{};                    // output written
    double seconds{};                  // processing time
    std::size_t spine_entries_removed{};
    std::size_t images_removed{};
    std::size_t markup_files_rewritten{};
    std::size_t titles_shortened{};
    std::vector<inkpress::Warning> warnings;
    std::string error_kind;            // if !success, error category
    std::string error_msg;             // if !success, reason of failure
};

Result make_result(const inkpress::ProcessResult& processed);

Result make_failed_result(const std::filesystem::path& input,
                          const std::filesystem::path& output,
                          const std::string& error_kind,
                          const std::string& error_msg,
                          double seconds);

void print_console_report(const Result& result);

/// @return false if the report file could not be written.
bool export_csv_report(const Result& result, const std::filesystem::path& output_path);

unsigned get_terminal_width();

#endif // INKPRESS_REPORT_GENERATOR_HPP
