#include "../../include/errors.hpp"

namespace inkpress {

namespace {
std::string format_message(const std::string& message, const std::filesystem::path& path) {
    if (path.empty()) return message;
    return message + ": " + path.string();
}
} // namespace

InkpressError::InkpressError(const ErrorKind kind, const std::string& message, std::filesystem::path path)
    : std::runtime_error(format_message(message, path)), kind_(kind), path_(std::move(path)) {}

const char* error_kind_to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidInput:     return "InvalidInput";
        case ErrorKind::MalformedPackage: return "MalformedPackage";
        case ErrorKind::ContainerIO:      return "ContainerIOError";
    }
    return "Unknown";
}

const char* warning_kind_to_string(const WarningKind kind) noexcept {
    switch (kind) {
        case WarningKind::Navigation:        return "NavigationWarning";
        case WarningKind::MediaDeletion:     return "MediaDeletion";
        case WarningKind::Markup:            return "Markup";
        case WarningKind::StylesheetMissing: return "StylesheetMissing";
        case WarningKind::SpineShape:        return "SpineShape";
        case WarningKind::MissingMimetype:   return "MissingMimetype";
    }
    return "Unknown";
}

} // namespace inkpress
