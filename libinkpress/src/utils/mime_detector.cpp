#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <array>

std::string inkpress::MimeDetector::detect(const std::filesystem::path& path)
{
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

bool inkpress::MimeDetector::is_zip_family(const std::string_view mime) noexcept
{
    static constexpr std::array<std::string_view, 4> kZipMimes = {
        "application/epub+zip",
        "application/zip",
        "application/x-zip-compressed",
        "application/octet-stream"
    };
    for (const auto m : kZipMimes) {
        if (mime == m) return true;
    }
    return false;
}
