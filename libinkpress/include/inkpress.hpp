/**
 * @file inkpress.hpp
 * @brief Public entry point of the inkpress library.
 */

#ifndef INKPRESS_HPP
#define INKPRESS_HPP

#include "epub_pipeline.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace inkpress {

/**
 * @brief Callbacks for embedding applications. Every method defaults to a no-op.
 */
struct InkpressObserver {
    virtual ~InkpressObserver() = default;

    virtual void onStageStart(const std::filesystem::path& input, const std::string& stage) {}

    virtual void onWarning(const std::filesystem::path& input,
                           const std::string& kind,
                           const std::string& message) {}

    virtual void onFinish(const std::filesystem::path& input,
                          const std::filesystem::path& output,
                          std::uintmax_t size_before,
                          std::uintmax_t size_after) {}

    virtual void onError(const std::filesystem::path& input, const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Fluent configuration plus execution of the EPUB pipeline.
 *
 * @code
 * inkpress::Inkpress ink;
 * ink.maxTitleLength(40).stylesheet("eink.css");
 * auto result = ink.process("in.epub", "out/in.epub");
 * @endcode
 *
 * Provenance defaults to the WORKFLOW_RUN_ID and GIT_SHA environment variables.
 */
class Inkpress {
public:
    Inkpress();
    ~Inkpress();

    Inkpress(const Inkpress&) = delete;
    Inkpress& operator=(const Inkpress&) = delete;
    Inkpress(Inkpress&&) noexcept;
    Inkpress& operator=(Inkpress&&) noexcept;

    // --- Configuration ---

    Inkpress& maxTitleLength(std::size_t val);

    Inkpress& skipPages(std::size_t val);

    Inkpress& stylesheet(const std::filesystem::path& css);

    Inkpress& stripImages(bool val);

    Inkpress& debug(bool val);

    Inkpress& provenance(const std::string& workflow_run_id, const std::string& git_sha);

    [[nodiscard]] const PipelineOptions& options() const noexcept;

    // --- Observability ---

    void setObserver(InkpressObserver* observer);

    // --- Execution ---

    /**
     * @brief Processes one EPUB.
     * @throws InvalidInputError, MalformedPackageError, ContainerIOError,
     *         or std::invalid_argument for an out-of-range title length.
     */
    ProcessResult process(const std::filesystem::path& input, const std::filesystem::path& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace inkpress

#endif // INKPRESS_HPP
