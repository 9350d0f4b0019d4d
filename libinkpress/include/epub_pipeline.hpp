/**
 * @file epub_pipeline.hpp
 * @brief Orchestrates the transformation of one EPUB for e-ink devices.
 */

#ifndef INKPRESS_EPUB_PIPELINE_HPP
#define INKPRESS_EPUB_PIPELINE_HPP

#include "diagnostics.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "title_shortener.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace inkpress {

/// Leading spine entries dropped by default (cover page and index page).
inline constexpr std::size_t kDefaultSkipPages = 2;

struct PipelineOptions {
    std::size_t max_title_length = kDefaultMaxTitleLength;
    std::size_t skip_leading_pages = kDefaultSkipPages;
    std::optional<std::filesystem::path> stylesheet; ///< copied to `<opf dir>/stylesheet.css`
    bool strip_images = true;
    bool debug = false;
    Provenance provenance;
};

/**
 * @brief Summary of a successful run.
 */
struct ProcessResult {
    std::filesystem::path input;
    std::filesystem::path output;
    std::uintmax_t input_size = 0;
    std::uintmax_t output_size = 0;
    std::chrono::milliseconds duration{0};
    std::size_t spine_entries_removed = 0;
    std::size_t images_removed = 0;
    std::size_t markup_files_rewritten = 0;
    std::size_t titles_shortened = 0;
    std::vector<Warning> warnings; ///< non-fatal problems, in the order they occurred
};

/**
 * @brief Runs Validate -> Extract -> ParseOPF -> TrimSpine -> StripImages ->
 * ReplaceStylesheet -> RewriteNavigation -> EmbedDiagnostics -> SerializeOPF
 * -> Repack -> Finalize over one input.
 *
 * @details Every run owns its own extraction directory, released on every
 * exit path, so several pipelines may run concurrently on different
 * outputs. Progress is published on the EventBus given at construction.
 */
class EpubPipeline {
public:
    /**
     * @throws std::invalid_argument if options.max_title_length is below kMinTitleLength.
     */
    EpubPipeline(PipelineOptions options, EventBus& bus);

    /**
     * @brief Transforms @p input into @p output.
     *
     * @throws InvalidInputError, MalformedPackageError or ContainerIOError.
     *         Nothing is written to @p output in that case.
     */
    ProcessResult process(const std::filesystem::path& input, const std::filesystem::path& output);

    [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }

private:
    PipelineOptions options_;
    EventBus& event_bus_;
};

} // namespace inkpress

#endif // INKPRESS_EPUB_PIPELINE_HPP
