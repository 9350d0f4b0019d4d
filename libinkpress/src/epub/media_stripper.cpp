#include "../../include/media_stripper.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/xml_utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace inkpress {

namespace fs = std::filesystem;

static const char* stripper_tag() {
    return "MediaStripper";
}

namespace {

constexpr std::string_view kCoverMarker = "cover";

bool is_markup_file(const fs::path& file) {
    const auto ext = to_lower_copy(file.extension().string());
    return ext == ".xhtml" || ext == ".html" || ext == ".htm";
}

std::string image_reference(const xmlNode* node) {
    auto ref = xml::attribute(node, "src");
    if (ref.empty()) ref = xml::xlink_href(node);
    if (ref.empty()) ref = xml::attribute(node, "href");
    return ref;
}

bool is_image_reference(const xmlNode* n) {
    if (xml::is_element(n, "img", true)) return true;
    return xml::is_element(n, "image") && xml::namespace_of(n) == xml::kSvgNamespace;
}

// <div class="...img..."> wrappers only, structural elements stay
bool is_image_wrapper(const xmlNode* n) {
    return xml::is_element(n, "div", true) && contains_icase(xml::attribute(n, "class"), "img");
}

std::size_t remove_all(const std::vector<xmlNode*>& nodes) {
    for (xmlNode* n : nodes) xml::remove_node(n);
    return nodes.size();
}

// img / svg image not pointing at the cover, then figures and "*img*" divs left empty
std::size_t strip_tree(xmlNode* root) {
    std::size_t removed = remove_all(xml::collect_elements(root, [](const xmlNode* n) {
        return is_image_reference(n) && !contains_icase(image_reference(n), kCoverMarker);
    }));

    // innermost first, so a wrapper emptied by its child goes too
    auto wrappers = xml::collect_elements(root, [root](const xmlNode* n) {
        if (n == root || is_image_reference(n)) return false;
        return xml::is_element(n, "figure", true) || is_image_wrapper(n);
    });
    std::reverse(wrappers.begin(), wrappers.end());
    for (xmlNode* wrapper : wrappers) {
        if (xml::is_blank(wrapper)) { xml::remove_node(wrapper); ++removed; }
    }
    return removed;
}

} // namespace

MediaStripper::MediaStripper()
    : remover_([](const fs::path& file, std::error_code& ec) { return fs::remove(file, ec); }) {}

MediaStripper::MediaStripper(FileRemover remover) : remover_(std::move(remover)) {}

bool MediaStripper::is_strippable_image(const fs::path& file) {
    const auto ext = to_lower_copy(file.extension().string());
    if (std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) == kImageExtensions.end()) {
        return false;
    }
    return !contains_icase(file.filename().string(), kCoverMarker);
}

std::size_t MediaStripper::strip_markup(const fs::path& document) {
    std::string error;
    bool as_html = false;
    auto doc = xml::read_xml_file(document, error);
    if (!doc && to_lower_copy(document.extension().string()) != ".xhtml") {
        doc = xml::read_html_file(document, error);
        as_html = true;
    }
    if (!doc) {
        throw std::runtime_error("cannot parse markup (" + error + ")");
    }

    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) return 0;

    const std::size_t removed = strip_tree(root);
    if (removed == 0) return 0;

    const bool saved = as_html ? xml::save_html_file(document, doc.get())
                               : xml::save_xml_file(document, doc.get());
    if (!saved) {
        throw std::runtime_error("cannot save markup (" + xml::last_error() + ")");
    }
    return removed;
}

std::size_t MediaStripper::delete_image_files(const fs::path& root, StripResult& result) const {
    std::vector<fs::path> victims;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && is_strippable_image(it->path())) {
            victims.push_back(it->path());
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Directory walk stopped early: " + ec.message(), stripper_tag());
    }
    std::sort(victims.begin(), victims.end());

    std::size_t removed = 0;
    for (const auto& file : victims) {
        std::error_code rm_ec;
        if (remover_(file, rm_ec)) {
            Logger::log(LogLevel::Debug, "Removed image: " + file.string(), stripper_tag());
            ++removed;
        } else {
            const std::string message = "Failed to remove image: " +
                (rm_ec ? rm_ec.message() : std::string("file vanished"));
            Logger::log(LogLevel::Warning, message + " (" + file.string() + ")", stripper_tag());
            result.warnings.push_back({WarningKind::MediaDeletion, message, file});
        }
    }
    return removed;
}

StripResult MediaStripper::strip_images(const fs::path& root, PackageDocument& package) const {
    StripResult result;

    result.files_removed = delete_image_files(root, result);

    result.manifest_items_removed = package.remove_items_if([](const ManifestItem& item) {
        return item.media_type.starts_with("image/") && !contains_icase(item.href, kCoverMarker);
    });

    std::vector<fs::path> documents;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && is_markup_file(it->path())) {
            documents.push_back(it->path());
        }
    }
    std::sort(documents.begin(), documents.end());

    for (const auto& document : documents) {
        try {
            const auto removed = strip_markup(document);
            if (removed > 0) {
                ++result.markup_files_rewritten;
                result.elements_removed += removed;
                Logger::log(LogLevel::Debug, "Removed " + std::to_string(removed) + " image elements from " +
                            document.filename().string(), stripper_tag());
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning, std::string(e.what()) + ": " + document.string(), stripper_tag());
            result.warnings.push_back({WarningKind::Markup, e.what(), document});
        }
    }

    Logger::log(LogLevel::Info, "Removed " + std::to_string(result.files_removed) + " images, " +
                std::to_string(result.manifest_items_removed) + " manifest items, rewrote " +
                std::to_string(result.markup_files_rewritten) + " documents", stripper_tag());
    return result;
}

} // namespace inkpress
