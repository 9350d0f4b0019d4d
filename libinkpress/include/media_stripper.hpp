/**
 * @file media_stripper.hpp
 * @brief Removal of image files and of every reference to them.
 */

#ifndef INKPRESS_MEDIA_STRIPPER_HPP
#define INKPRESS_MEDIA_STRIPPER_HPP

#include "errors.hpp"
#include "package_document.hpp"
#include <array>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string_view>
#include <system_error>
#include <vector>

namespace inkpress {

/// Extensions treated as images, lower case with the leading dot.
inline constexpr std::array<std::string_view, 6> kImageExtensions = {
    ".jpg", ".jpeg", ".png", ".gif", ".svg", ".webp"
};

struct StripResult {
    std::size_t files_removed = 0;
    std::size_t manifest_items_removed = 0;
    std::size_t markup_files_rewritten = 0;
    std::size_t elements_removed = 0;
    std::vector<Warning> warnings; ///< undeletable files, unparsable markup
};

/**
 * @brief Strips raster and vector images from an extracted EPUB.
 *
 * Anything whose name or reference contains "cover" (case-insensitive) is
 * kept. Running it twice on the same tree removes nothing the second time.
 */
class MediaStripper {
public:
    /// Deletes one file, same contract as the error_code overload of std::filesystem::remove.
    using FileRemover = std::function<bool(const std::filesystem::path&, std::error_code&)>;

    MediaStripper();
    explicit MediaStripper(FileRemover remover);

    /**
     * @brief Deletes image files under @p root, drops `image/` manifest
     * items and removes image references from every html/xhtml document.
     *
     * Individual failures never abort: they are reported as warnings and the
     * remaining steps still run.
     */
    StripResult strip_images(const std::filesystem::path& root, PackageDocument& package) const;

    /// True for a non-cover file with one of kImageExtensions.
    [[nodiscard]] static bool is_strippable_image(const std::filesystem::path& file);

    /**
     * @brief Removes image references from a single markup document.
     * @return Number of removed elements. The file is only rewritten if non-zero.
     * @throws std::runtime_error if the document can't be parsed or saved.
     */
    static std::size_t strip_markup(const std::filesystem::path& document);

private:
    std::size_t delete_image_files(const std::filesystem::path& root, StripResult& result) const;

    FileRemover remover_;
};

} // namespace inkpress

#endif // INKPRESS_MEDIA_STRIPPER_HPP
