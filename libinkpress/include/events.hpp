/**
 * @file events.hpp
 * @brief Progress events published by the EPUB pipeline.
 */

#ifndef INKPRESS_EVENTS_HPP
#define INKPRESS_EVENTS_HPP

#include "errors.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace inkpress {

/**
 * @brief Linear stages of one pipeline run, in execution order.
 */
enum class PipelineStage {
    Validate,
    Extract,
    ParseOPF,
    TrimSpine,
    StripImages,
    ReplaceStylesheet,
    RewriteNavigation,
    EmbedDiagnostics,
    SerializeOPF,
    Repack,
    Finalize
};

const char* stage_to_string(PipelineStage stage) noexcept;

/**
 * @brief Emitted when a stage begins.
 */
struct StageStartEvent {
    std::filesystem::path input; ///< EPUB being processed
    PipelineStage stage;
};

/**
 * @brief Emitted when a stage ends, skipped stages included.
 */
struct StageCompleteEvent {
    std::filesystem::path input;
    PipelineStage stage;
    bool skipped = false;                  ///< stage had nothing to do (e.g. no stylesheet configured)
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted for every non-fatal problem, as soon as it is recorded.
 */
struct WarningEvent {
    std::filesystem::path input;
    PipelineStage stage;
    Warning warning;
};

/**
 * @brief Emitted once the output file is in place.
 */
struct PipelineCompleteEvent {
    std::filesystem::path input;
    std::filesystem::path output;
    std::uintmax_t input_size = 0;
    std::uintmax_t output_size = 0;
    std::size_t warning_count = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a fatal error aborts the run. No output exists.
 */
struct PipelineErrorEvent {
    std::filesystem::path input;
    PipelineStage stage;        ///< stage that failed
    ErrorKind kind;
    std::string error_message;
};

} // namespace inkpress

#endif // INKPRESS_EVENTS_HPP
