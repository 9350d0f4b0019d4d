#include "../../include/navigation_rewriter.hpp"
#include "../../include/logger.hpp"
#include "../../include/xml_utils.hpp"
#include <system_error>

namespace inkpress {

namespace fs = std::filesystem;

static const char* navigation_tag() {
    return "NavigationRewriter";
}

namespace {

constexpr std::string_view kNcxMediaType = "application/x-dtbncx+xml";

std::optional<fs::path> existing(const fs::path& p) {
    std::error_code ec;
    if (fs::is_regular_file(p, ec)) return p;
    return std::nullopt;
}

bool in_ncx_namespace(const xmlNode* node) {
    const auto ns = xml::namespace_of(node);
    return ns.empty() || ns == xml::kNcxNamespace;
}

bool in_xhtml_namespace(const xmlNode* node) {
    const auto ns = xml::namespace_of(node);
    return ns.empty() || ns == xml::kXhtmlNamespace;
}

// label of a navPoint: navPoint/navLabel/text
xmlNode* label_text_of(xmlNode* nav_point) {
    for (xmlNode* child : xml::element_children(nav_point)) {
        if (!xml::is_element(child, "navLabel")) continue;
        for (xmlNode* text : xml::element_children(child)) {
            if (xml::is_element(text, "text")) return text;
        }
    }
    return nullptr;
}

bool has_only_text(const xmlNode* element) {
    bool any = false;
    for (const xmlNode* child = element->children; child; child = child->next) {
        if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
            any = true;
        } else if (child->type != XML_COMMENT_NODE) {
            return false;
        }
    }
    return any;
}

xml::XmlDocPtr load(const fs::path& document, const std::string_view dialect) {
    std::string error;
    auto doc = xml::read_xml_file(document, error);
    if (!doc) {
        throw NavigationError("Failed to parse " + std::string(dialect) + " document (" + error + ")", document);
    }
    return doc;
}

void store(const fs::path& document, xmlDoc* doc, const std::string_view dialect) {
    if (!xml::save_xml_file(document, doc)) {
        throw NavigationError("Failed to save " + std::string(dialect) + " document (" + xml::last_error() + ")",
                              document);
    }
}

// replaces the text of a label element, returns true if it changed
bool apply(xmlNode* element, const LabelTransform& transform) {
    const std::string original = xml::text_content(element);
    if (original.empty()) return false;
    const std::string replaced = transform(original);
    if (replaced == original) return false;
    xml::set_text(element, replaced);
    Logger::log(LogLevel::Debug, "'" + original + "' -> '" + replaced + "'", navigation_tag());
    return true;
}

} // namespace

std::optional<fs::path> NcxRewriter::locate(const PackageDocument& package) const {
    if (const auto* item = package.find_item_by_media_type(kNcxMediaType)) {
        if (auto p = existing(package.resolve(*item))) return p;
    }
    return existing(package.directory() / "toc.ncx");
}

NavigationStats NcxRewriter::rewrite(const fs::path& document, const LabelTransform& transform) {
    Logger::log(LogLevel::Debug, "Processing TOC NCX: " + document.string(), navigation_tag());
    auto doc = load(document, get_name());

    NavigationStats stats;
    stats.document = document;
    xmlNode* root = xmlDocGetRootElement(doc.get());

    // sections: top-level navPoints that have nested navPoints
    const auto nav_maps = xml::collect_elements(root, [](const xmlNode* n) {
        return xml::is_element(n, "navMap") && in_ncx_namespace(n);
    });
    if (!nav_maps.empty()) {
        for (xmlNode* point : xml::element_children(nav_maps.front())) {
            if (!xml::is_element(point, "navPoint")) continue;
            bool nested = false;
            for (xmlNode* child : xml::element_children(point)) {
                if (xml::is_element(child, "navPoint")) { nested = true; break; }
            }
            xmlNode* label = label_text_of(point);
            if (nested && label) stats.sections.push_back(xml::text_content(label));
        }
    }

    const auto labels = xml::collect_elements(root, [](const xmlNode* n) {
        return xml::is_element(n, "text") && in_ncx_namespace(n) &&
               n->parent && xml::is_element(n->parent, "navLabel");
    });
    for (xmlNode* text : labels) {
        ++stats.labels_seen;
        if (apply(text, transform)) ++stats.labels_changed;
    }

    if (stats.labels_changed > 0) {
        store(document, doc.get(), get_name());
    }
    Logger::log(LogLevel::Info, "Modified " + std::to_string(stats.labels_changed) + " of " +
                std::to_string(stats.labels_seen) + " NCX entries", navigation_tag());
    return stats;
}

std::optional<fs::path> NavDocumentRewriter::locate(const PackageDocument& package) const {
    if (const auto* item = package.find_item_with_property("nav")) {
        if (auto p = existing(package.resolve(*item))) return p;
    }
    return existing(package.directory() / "nav.xhtml");
}

NavigationStats NavDocumentRewriter::rewrite(const fs::path& document, const LabelTransform& transform) {
    Logger::log(LogLevel::Debug, "Processing NAV XHTML: " + document.string(), navigation_tag());
    auto doc = load(document, get_name());

    NavigationStats stats;
    stats.document = document;
    const auto anchors = xml::collect_elements(xmlDocGetRootElement(doc.get()), [](const xmlNode* n) {
        return xml::is_element(n, "a") && in_xhtml_namespace(n);
    });
    for (xmlNode* anchor : anchors) {
        if (!has_only_text(anchor)) continue;
        ++stats.labels_seen;
        if (apply(anchor, transform)) ++stats.labels_changed;
    }

    if (stats.labels_changed > 0) {
        store(document, doc.get(), get_name());
    }
    Logger::log(LogLevel::Info, "Modified " + std::to_string(stats.labels_changed) + " of " +
                std::to_string(stats.labels_seen) + " NAV entries", navigation_tag());
    return stats;
}

std::vector<std::unique_ptr<INavigationRewriter>> make_navigation_rewriters() {
    std::vector<std::unique_ptr<INavigationRewriter>> rewriters;
    rewriters.push_back(std::make_unique<NcxRewriter>());
    rewriters.push_back(std::make_unique<NavDocumentRewriter>());
    return rewriters;
}

} // namespace inkpress
