/**
 * @file epub_container.hpp
 * @brief Reading and writing of the EPUB ZIP container.
 */

#ifndef INKPRESS_EPUB_CONTAINER_HPP
#define INKPRESS_EPUB_CONTAINER_HPP

#include "errors.hpp"
#include "file_utils.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace inkpress {

/// Smallest file size accepted as a plausible EPUB.
inline constexpr std::uintmax_t kMinEpubSize = 1000;

/// Exact content of the mandatory mimetype entry.
inline constexpr std::string_view kEpubMimetype = "application/epub+zip";

/**
 * @brief Archive-level facts gathered without extracting anything.
 */
struct ContainerInfo {
    std::uintmax_t file_size = 0;
    std::vector<std::string> entry_names; ///< in archive order
    bool has_mimetype = false;
    bool mimetype_first = false;
};

/**
 * @brief Opens and re-emits EPUB containers.
 *
 * @details An EPUB is a ZIP archive whose first entry must be an
 * uncompressed file named `mimetype` holding exactly
 * "application/epub+zip". extract() materializes the archive in a
 * ScopedTempDir; pack() writes a directory tree back into a conformant
 * container. Both use libarchive.
 */
class EpubContainer {
public:
    /**
     * @brief Validates an input container and lists its entries.
     * @throws InvalidInputError if the file is missing, smaller than
     *         kMinEpubSize, or not a readable ZIP archive.
     */
    static ContainerInfo inspect(const std::filesystem::path& input_path);

    /**
     * @brief Extracts every entry of the container into a fresh temporary
     * directory that is removed when the returned object goes out of scope.
     *
     * A missing `mimetype` entry is not fatal: it is logged and appended to
     * @p warnings.
     *
     * @throws InvalidInputError for the same conditions as inspect(), or when
     *         an entry name escapes the extraction root.
     * @throws ContainerIOError if an entry can't be read or written to disk.
     */
    static ScopedTempDir extract(const std::filesystem::path& input_path,
                                 std::vector<Warning>& warnings);

    static ScopedTempDir extract(const std::filesystem::path& input_path);

    /**
     * @brief Packs a directory tree into an EPUB container.
     *
     * `mimetype` is written first and stored uncompressed (synthesized when
     * the tree has none); every other regular file follows, deflated, named
     * by its path relative to @p source_dir. The archive is written to a
     * temporary sibling of @p output_path and moved into place, replacing
     * any existing file. Missing parent directories are created.
     *
     * @return Size in bytes of the written container.
     * @throws ContainerIOError on any I/O failure; no partial file is left
     *         at @p output_path.
     */
    static std::uintmax_t pack(const std::filesystem::path& source_dir,
                               const std::filesystem::path& output_path);
};

} // namespace inkpress

#endif // INKPRESS_EPUB_CONTAINER_HPP
