/**
 * @file errors.hpp
 * @brief Fatal error types and non-fatal warning records.
 */

#ifndef INKPRESS_ERRORS_HPP
#define INKPRESS_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace inkpress {

/**
 * @brief Kinds of fatal failures. Each one aborts the pipeline.
 */
enum class ErrorKind {
    InvalidInput,     ///< missing, wrongly named, undersized or non-ZIP input
    MalformedPackage, ///< package document without manifest/spine, or dangling spine refs
    ContainerIO       ///< extraction or re-packing failed
};

const char* error_kind_to_string(ErrorKind kind) noexcept;

/**
 * @brief Base class of every fatal inkpress error.
 *
 * @details Carries the offending path so the caller can diagnose a
 * failure from the message alone. what() is formatted as
 * "<message>: <path>" when a path is present.
 */
class InkpressError : public std::runtime_error {
public:
    InkpressError(ErrorKind kind, const std::string& message, std::filesystem::path path = {});

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    ErrorKind kind_;
    std::filesystem::path path_;
};

class InvalidInputError final : public InkpressError {
public:
    explicit InvalidInputError(const std::string& message, std::filesystem::path path = {})
        : InkpressError(ErrorKind::InvalidInput, message, std::move(path)) {}
};

class MalformedPackageError final : public InkpressError {
public:
    explicit MalformedPackageError(const std::string& message, std::filesystem::path path = {})
        : InkpressError(ErrorKind::MalformedPackage, message, std::move(path)) {}
};

class ContainerIOError final : public InkpressError {
public:
    explicit ContainerIOError(const std::string& message, std::filesystem::path path = {})
        : InkpressError(ErrorKind::ContainerIO, message, std::move(path)) {}
};

/**
 * @brief Raised by navigation rewriters when a document can't be parsed
 * or saved. The pipeline turns it into a Navigation warning.
 */
class NavigationError final : public std::runtime_error {
public:
    NavigationError(const std::string& message, std::filesystem::path path)
        : std::runtime_error(message), path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Kinds of non-fatal problems collected during a run.
 */
enum class WarningKind {
    Navigation,        ///< navigation document present but unparsable
    MediaDeletion,     ///< an image file could not be deleted
    Markup,            ///< a markup document could not be rewritten
    StylesheetMissing, ///< configured replacement stylesheet not found
    SpineShape,        ///< fewer spine entries than the configured trim count
    MissingMimetype    ///< input archive has no mimetype entry
};

const char* warning_kind_to_string(WarningKind kind) noexcept;

struct Warning {
    WarningKind kind;
    std::string message;
    std::filesystem::path path;
};

} // namespace inkpress

#endif // INKPRESS_ERRORS_HPP
