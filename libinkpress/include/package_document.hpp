/**
 * @file package_document.hpp
 * @brief In-memory model of the OPF package document.
 */

#ifndef INKPRESS_PACKAGE_DOCUMENT_HPP
#define INKPRESS_PACKAGE_DOCUMENT_HPP

#include "errors.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

struct _xmlDoc;
struct _xmlNode;

namespace inkpress {

/// Attributes other than the ones modelled explicitly, in document order.
using AttributeList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief One `<item>` of the manifest.
 */
struct ManifestItem {
    std::string id;
    std::string href;       ///< relative to the package document's directory
    std::string media_type;
    AttributeList extra_attributes; ///< properties, fallback, media-overlay...

    /// True if the space separated `properties` attribute lists @p property.
    [[nodiscard]] bool has_property(std::string_view property) const;
};

/**
 * @brief One `<itemref>` of the spine.
 */
struct SpineItemRef {
    std::string idref;
    AttributeList extra_attributes; ///< linear, properties...
};

/**
 * @brief Parsed OPF package document.
 *
 * @details The manifest and the spine are held as plain value vectors with
 * an id index; every mutation goes through this class, so no caller ever
 * keeps a pointer into the XML tree. The rest of the document (metadata,
 * guide, namespace declarations, whitespace) stays in the libxml2 tree and
 * is re-emitted untouched by serialize(), which reconciles the `<manifest>`
 * and `<spine>` elements with the model.
 *
 * Invariant: every spine idref resolves to a manifest item.
 */
class PackageDocument {
public:
    /**
     * @brief Parses a package document from disk.
     * @throws MalformedPackageError if the file is not well-formed XML, has
     *         no manifest or spine element, or a spine entry doesn't resolve.
     */
    static PackageDocument parse(const std::filesystem::path& opf_path);

    PackageDocument(PackageDocument&& other) noexcept;
    PackageDocument& operator=(PackageDocument&& other) noexcept;
    PackageDocument(const PackageDocument&) = delete;
    PackageDocument& operator=(const PackageDocument&) = delete;
    ~PackageDocument();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Directory every manifest href is relative to.
    [[nodiscard]] std::filesystem::path directory() const { return path_.parent_path(); }

    // --- manifest ---

    [[nodiscard]] const std::vector<ManifestItem>& manifest() const noexcept { return manifest_; }
    [[nodiscard]] const ManifestItem* find_item(std::string_view id) const;
    [[nodiscard]] const ManifestItem* find_item_by_media_type(std::string_view media_type) const;
    [[nodiscard]] const ManifestItem* find_item_with_property(std::string_view property) const;

    /// Absolute on-disk location of a manifest item (fragment stripped, %-escapes decoded).
    [[nodiscard]] std::filesystem::path resolve(const ManifestItem& item) const;

    /// Returns @p base if no item uses it as id, otherwise base-2, base-3...
    [[nodiscard]] std::string unique_id(std::string_view base) const;

    /**
     * @brief Appends an item to the manifest.
     * @return false (and leaves the manifest untouched) if the id is taken.
     */
    bool add_item(ManifestItem item);

    /**
     * @brief Removes a manifest item. Spine references to it are dropped too.
     * @return true if the item existed.
     */
    bool remove_item(std::string_view id);

    /**
     * @brief Removes every manifest item matching @p predicate.
     * @return Number of removed items.
     */
    std::size_t remove_items_if(const std::function<bool(const ManifestItem&)>& predicate);

    // --- spine ---

    [[nodiscard]] const std::vector<SpineItemRef>& spine() const noexcept { return spine_; }

    /**
     * @brief Drops the first @p n spine entries, keeping the order of the rest.
     *
     * Never fails: with fewer than @p n entries the spine ends up empty. The
     * referenced manifest items are kept, navigation may still link them.
     *
     * @return Number of entries actually removed.
     */
    std::size_t remove_leading_spine_entries(std::size_t n);

    // --- output ---

    /**
     * @brief Serializes the package: XML declaration, UTF-8, namespaces and
     * prefixes exactly as originally declared.
     */
    [[nodiscard]] std::string serialize();

    /// Serializes back to path(). Throws ContainerIOError on write failure.
    void save();

private:
    PackageDocument() = default;

    void rebuild_index();
    void sync_manifest();
    void sync_spine();

    std::filesystem::path path_;
    _xmlDoc* doc_ = nullptr;
    _xmlNode* manifest_node_ = nullptr;
    _xmlNode* spine_node_ = nullptr;

    std::vector<ManifestItem> manifest_;
    std::vector<SpineItemRef> spine_;
    std::unordered_map<std::string, std::size_t> index_;
};

/**
 * @brief Finds the package document inside an extracted EPUB.
 *
 * Reads `META-INF/container.xml` and falls back to the first `*.opf`
 * file of a recursive walk.
 *
 * @throws MalformedPackageError if no package document exists.
 */
std::filesystem::path locate_package_document(const std::filesystem::path& root);

} // namespace inkpress

#endif // INKPRESS_PACKAGE_DOCUMENT_HPP
