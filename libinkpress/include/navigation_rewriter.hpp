/**
 * @file navigation_rewriter.hpp
 * @brief In-place rewriting of table-of-contents labels.
 */

#ifndef INKPRESS_NAVIGATION_REWRITER_HPP
#define INKPRESS_NAVIGATION_REWRITER_HPP

#include "errors.hpp"
#include "package_document.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inkpress {

/// Maps a label to its replacement. Returning the input leaves the label untouched.
using LabelTransform = std::function<std::string(std::string_view)>;

/**
 * @brief Outcome of rewriting one navigation document.
 */
struct NavigationStats {
    std::filesystem::path document;
    std::size_t labels_seen = 0;
    std::size_t labels_changed = 0;
    std::vector<std::string> sections; ///< top-level entries that have children
};

/**
 * @brief Rewrites the human-readable labels of one navigation dialect.
 *
 * Implementations leave hierarchy, hrefs and ordering untouched: only
 * label text nodes change, and the document is saved only if one did.
 */
class INavigationRewriter {
public:
    virtual ~INavigationRewriter() = default;

    /// @return Human-readable name of the dialect (e.g. "NCX").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Finds this dialect's document for a package.
     * @return Path of an existing file, or std::nullopt if the package has none.
     */
    [[nodiscard]] virtual std::optional<std::filesystem::path>
    locate(const PackageDocument& package) const = 0;

    /**
     * @brief Applies @p transform to every label of @p document in place.
     * @throws NavigationError if the document can't be parsed or saved.
     */
    virtual NavigationStats rewrite(const std::filesystem::path& document,
                                    const LabelTransform& transform) = 0;
};

/**
 * @brief Legacy NCX navigation: `navPoint/navLabel/text` elements.
 */
class NcxRewriter final : public INavigationRewriter {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "NCX"; }

    /// Manifest item of type application/x-dtbncx+xml, else `toc.ncx` next to the OPF.
    [[nodiscard]] std::optional<std::filesystem::path>
    locate(const PackageDocument& package) const override;

    NavigationStats rewrite(const std::filesystem::path& document,
                            const LabelTransform& transform) override;
};

/**
 * @brief EPUB 3 navigation document: text of the `<a>` entries.
 *
 * Only anchors whose content is plain text are rewritten; anchors wrapping
 * other markup are left alone.
 */
class NavDocumentRewriter final : public INavigationRewriter {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "NAV"; }

    /// Manifest item with the `nav` property, else `nav.xhtml` next to the OPF.
    [[nodiscard]] std::optional<std::filesystem::path>
    locate(const PackageDocument& package) const override;

    NavigationStats rewrite(const std::filesystem::path& document,
                            const LabelTransform& transform) override;
};

/// Every available rewriter, NCX first.
std::vector<std::unique_ptr<INavigationRewriter>> make_navigation_rewriters();

} // namespace inkpress

#endif // INKPRESS_NAVIGATION_REWRITER_HPP
