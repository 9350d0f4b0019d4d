#ifndef INKPRESS_MIME_DETECTOR_HPP
#define INKPRESS_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace inkpress {

    /**
     * @brief Content-based file type detection backed by libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         * @param path The filesystem path to the file.
         * @return The MIME type (e.g., "application/epub+zip"), or an empty
         * string when the magic database is unavailable.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief True for the MIME types libmagic reports for ZIP-based
         * containers (EPUB, plain ZIP, generic binary when the sniffing is
         * inconclusive).
         */
        static bool is_zip_family(std::string_view mime) noexcept;
    };

} // namespace inkpress

#endif // INKPRESS_MIME_DETECTOR_HPP
