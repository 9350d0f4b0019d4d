/**
 * @file diagnostics.hpp
 * @brief Build diagnostics embedded in every processed EPUB.
 */

#ifndef INKPRESS_DIAGNOSTICS_HPP
#define INKPRESS_DIAGNOSTICS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace inkpress {

/// File name of the record, next to the package document.
inline constexpr const char* kDiagnosticsFileName = "_diagnostics.json";
inline constexpr const char* kDiagnosticsMediaType = "application/json";
inline constexpr const char* kDiagnosticsItemId = "diagnostics";

/**
 * @brief Identifiers of the build that produced the file.
 */
struct Provenance {
    std::string workflow_run_id = "local";
    std::string git_sha = "unknown";

    /// Reads WORKFLOW_RUN_ID and GIT_SHA, keeping the defaults for unset or empty variables.
    static Provenance from_environment();
};

struct DiagnosticsRecord {
    std::chrono::system_clock::time_point build_time;
    Provenance provenance;
    std::string input_file;
    std::string output_file;
    std::uintmax_t raw_size_bytes = 0;
    std::string input_mime;
    std::chrono::milliseconds processing_time{0};
    bool debug_mode = false;
    std::vector<std::string> sections_found;
    std::size_t article_count = 0;
    std::size_t spine_entries_removed = 0;
    std::size_t images_removed = 0;
    std::size_t titles_shortened = 0;
    std::size_t warning_count = 0;

    /// Pretty-printed JSON document (two space indent).
    [[nodiscard]] std::string to_json() const;
};

/// UTC timestamp as `YYYY-MM-DDTHH:MM:SSZ`.
std::string format_utc(std::chrono::system_clock::time_point tp);

} // namespace inkpress

#endif // INKPRESS_DIAGNOSTICS_HPP
