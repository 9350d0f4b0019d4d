#include "../../include/package_document.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/xml_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace inkpress {

namespace fs = std::filesystem;

static const char* package_tag() {
    return "PackageDocument";
}

namespace {

const xmlChar* as_xml(const std::string& s) {
    return reinterpret_cast<const xmlChar*>(s.c_str());
}

bool in_package_namespace(const xmlNode* node) {
    const auto ns = xml::namespace_of(node);
    return ns.empty() || ns == xml::kOpfNamespace;
}

xmlNode* find_package_child(xmlNode* root, const std::string_view name) {
    const auto found = xml::collect_elements(root, [name](const xmlNode* n) {
        return xml::is_element(n, name) && in_package_namespace(n);
    });
    return found.empty() ? nullptr : found.front();
}

std::string qualified_name(const xmlAttr* attr) {
    std::string name = reinterpret_cast<const char*>(attr->name);
    if (attr->ns && attr->ns->prefix) {
        name = std::string(reinterpret_cast<const char*>(attr->ns->prefix)) + ":" + name;
    }
    return name;
}

// every attribute except the explicitly modelled ones
AttributeList extra_attributes(const xmlNode* node, const std::unordered_set<std::string_view>& modelled) {
    AttributeList out;
    for (const xmlAttr* attr = node->properties; attr; attr = attr->next) {
        const std::string name = qualified_name(attr);
        if (modelled.contains(name)) continue;
        xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
        out.emplace_back(name, value ? reinterpret_cast<const char*>(value) : "");
        xmlFree(value);
    }
    return out;
}

void set_attribute(xmlDoc* doc, xmlNode* node, const std::string& name, const std::string& value) {
    const auto colon = name.find(':');
    if (colon != std::string::npos) {
        const std::string prefix = name.substr(0, colon);
        const std::string local = name.substr(colon + 1);
        if (xmlNs* ns = xmlSearchNs(doc, node, as_xml(prefix))) {
            xmlSetNsProp(node, ns, as_xml(local), as_xml(value));
            return;
        }
    }
    xmlSetProp(node, as_xml(name), as_xml(value));
}

bool is_indentation(const xmlNode* node) {
    if (!node || node->type != XML_TEXT_NODE || !node->content) return false;
    for (const xmlChar* p = node->content; *p; ++p) {
        if (!std::isspace(*p)) return false;
    }
    return true;
}

// inserts a new element after `anchor`, copying the anchor's indentation
xmlNode* insert_after(xmlNode* parent, xmlNode* anchor, xmlNode* node) {
    if (!anchor) {
        xmlAddChild(parent, node);
        return node;
    }
    xmlNode* indent = anchor->prev;
    xmlAddNextSibling(anchor, node);
    if (is_indentation(indent)) {
        xmlAddPrevSibling(node, xmlNewDocText(parent->doc, indent->content));
    }
    return node;
}

std::string percent_decode(const std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(std::string(s.substr(i + 1, 2)), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

} // namespace

bool ManifestItem::has_property(const std::string_view property) const {
    for (const auto& [name, value] : extra_attributes) {
        if (name != "properties") continue;
        std::istringstream tokens(value);
        std::string token;
        while (tokens >> token) {
            if (token == property) return true;
        }
    }
    return false;
}

PackageDocument PackageDocument::parse(const fs::path& opf_path) {
    Logger::log(LogLevel::Info, "Parsing package document: " + opf_path.filename().string(), package_tag());

    std::string error;
    auto doc = xml::read_xml_file(opf_path, error);
    if (!doc) {
        throw MalformedPackageError("Failed to parse package document (" + error + ")", opf_path);
    }

    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!xml::is_element(root, "package")) {
        throw MalformedPackageError("Root element is not <package>", opf_path);
    }

    PackageDocument pkg;
    pkg.path_ = opf_path;
    pkg.manifest_node_ = find_package_child(root, "manifest");
    pkg.spine_node_ = find_package_child(root, "spine");
    if (!pkg.manifest_node_) {
        throw MalformedPackageError("No manifest element found in package document", opf_path);
    }
    if (!pkg.spine_node_) {
        throw MalformedPackageError("No spine element found in package document", opf_path);
    }

    static const std::unordered_set<std::string_view> kItemAttrs = {"id", "href", "media-type"};
    for (xmlNode* child : xml::element_children(pkg.manifest_node_)) {
        if (!xml::is_element(child, "item")) continue;
        ManifestItem item;
        item.id = xml::attribute(child, "id");
        item.href = xml::attribute(child, "href");
        item.media_type = xml::attribute(child, "media-type");
        item.extra_attributes = extra_attributes(child, kItemAttrs);
        if (item.id.empty()) {
            throw MalformedPackageError("Manifest item without id (href '" + item.href + "')", opf_path);
        }
        if (pkg.index_.contains(item.id)) {
            throw MalformedPackageError("Duplicate manifest id '" + item.id + "'", opf_path);
        }
        pkg.index_.emplace(item.id, pkg.manifest_.size());
        pkg.manifest_.push_back(std::move(item));
    }

    static const std::unordered_set<std::string_view> kRefAttrs = {"idref"};
    for (xmlNode* child : xml::element_children(pkg.spine_node_)) {
        if (!xml::is_element(child, "itemref")) continue;
        SpineItemRef ref;
        ref.idref = xml::attribute(child, "idref");
        ref.extra_attributes = extra_attributes(child, kRefAttrs);
        if (!pkg.index_.contains(ref.idref)) {
            throw MalformedPackageError("Spine entry '" + ref.idref + "' does not resolve in the manifest",
                                        opf_path);
        }
        pkg.spine_.push_back(std::move(ref));
    }

    pkg.doc_ = doc.release();
    Logger::log(LogLevel::Debug,
                "Manifest has " + std::to_string(pkg.manifest_.size()) + " items, spine has " +
                std::to_string(pkg.spine_.size()) + " entries",
                package_tag());
    return pkg;
}

PackageDocument::PackageDocument(PackageDocument&& other) noexcept
    : path_(std::move(other.path_)),
      doc_(std::exchange(other.doc_, nullptr)),
      manifest_node_(std::exchange(other.manifest_node_, nullptr)),
      spine_node_(std::exchange(other.spine_node_, nullptr)),
      manifest_(std::move(other.manifest_)),
      spine_(std::move(other.spine_)),
      index_(std::move(other.index_)) {}

PackageDocument& PackageDocument::operator=(PackageDocument&& other) noexcept {
    if (this != &other) {
        if (doc_) xmlFreeDoc(doc_);
        path_ = std::move(other.path_);
        doc_ = std::exchange(other.doc_, nullptr);
        manifest_node_ = std::exchange(other.manifest_node_, nullptr);
        spine_node_ = std::exchange(other.spine_node_, nullptr);
        manifest_ = std::move(other.manifest_);
        spine_ = std::move(other.spine_);
        index_ = std::move(other.index_);
    }
    return *this;
}

PackageDocument::~PackageDocument() {
    if (doc_) xmlFreeDoc(doc_);
}

const ManifestItem* PackageDocument::find_item(const std::string_view id) const {
    const auto it = index_.find(std::string(id));
    return it == index_.end() ? nullptr : &manifest_[it->second];
}

const ManifestItem* PackageDocument::find_item_by_media_type(const std::string_view media_type) const {
    const auto it = std::find_if(manifest_.begin(), manifest_.end(),
                                 [media_type](const ManifestItem& i) { return i.media_type == media_type; });
    return it == manifest_.end() ? nullptr : &*it;
}

const ManifestItem* PackageDocument::find_item_with_property(const std::string_view property) const {
    const auto it = std::find_if(manifest_.begin(), manifest_.end(),
                                 [property](const ManifestItem& i) { return i.has_property(property); });
    return it == manifest_.end() ? nullptr : &*it;
}

fs::path PackageDocument::resolve(const ManifestItem& item) const {
    std::string_view href = item.href;
    if (const auto hash = href.find('#'); hash != std::string_view::npos) {
        href = href.substr(0, hash);
    }
    return (directory() / fs::path(percent_decode(href))).lexically_normal();
}

std::string PackageDocument::unique_id(const std::string_view base) const {
    std::string candidate(base);
    for (int n = 2; index_.contains(candidate); ++n) {
        candidate = std::string(base) + "-" + std::to_string(n);
    }
    return candidate;
}

bool PackageDocument::add_item(ManifestItem item) {
    if (item.id.empty() || index_.contains(item.id)) return false;
    index_.emplace(item.id, manifest_.size());
    manifest_.push_back(std::move(item));
    return true;
}

bool PackageDocument::remove_item(const std::string_view id) {
    const std::string key(id);
    return remove_items_if([&key](const ManifestItem& i) { return i.id == key; }) > 0;
}

std::size_t PackageDocument::remove_items_if(const std::function<bool(const ManifestItem&)>& predicate) {
    std::unordered_set<std::string> removed;
    for (const auto& item : manifest_) {
        if (predicate(item)) removed.insert(item.id);
    }
    if (removed.empty()) return 0;

    std::erase_if(manifest_, [&removed](const ManifestItem& i) { return removed.contains(i.id); });
    const auto dropped = std::erase_if(spine_, [&removed](const SpineItemRef& r) { return removed.contains(r.idref); });
    if (dropped > 0) {
        Logger::log(LogLevel::Warning,
                    "Dropped " + std::to_string(dropped) + " spine entries referencing removed manifest items",
                    package_tag());
    }
    rebuild_index();
    return removed.size();
}

std::size_t PackageDocument::remove_leading_spine_entries(const std::size_t n) {
    const std::size_t count = std::min(n, spine_.size());
    for (std::size_t i = 0; i < count; ++i) {
        Logger::log(LogLevel::Debug, "Removing spine item " + std::to_string(i) + ": " + spine_[i].idref,
                    package_tag());
    }
    spine_.erase(spine_.begin(), spine_.begin() + static_cast<std::ptrdiff_t>(count));
    return count;
}

void PackageDocument::rebuild_index() {
    index_.clear();
    for (std::size_t i = 0; i < manifest_.size(); ++i) {
        index_.emplace(manifest_[i].id, i);
    }
}

void PackageDocument::sync_manifest() {
    std::unordered_set<std::string> present;
    xmlNode* last_item = nullptr;
    for (xmlNode* child : xml::element_children(manifest_node_)) {
        if (!xml::is_element(child, "item")) continue;
        const std::string id = xml::attribute(child, "id");
        if (!index_.contains(id)) {
            xml::remove_node(child);
            continue;
        }
        present.insert(id);
        last_item = child;
    }

    for (const auto& item : manifest_) {
        if (present.contains(item.id)) continue;
        xmlNode* node = xmlNewDocNode(doc_, manifest_node_->ns, reinterpret_cast<const xmlChar*>("item"), nullptr);
        set_attribute(doc_, node, "id", item.id);
        set_attribute(doc_, node, "href", item.href);
        set_attribute(doc_, node, "media-type", item.media_type);
        for (const auto& [name, value] : item.extra_attributes) {
            set_attribute(doc_, node, name, value);
        }
        last_item = insert_after(manifest_node_, last_item, node);
    }
}

void PackageDocument::sync_spine() {
    std::size_t next = 0;
    xmlNode* last_ref = nullptr;
    for (xmlNode* child : xml::element_children(spine_node_)) {
        if (!xml::is_element(child, "itemref")) continue;
        if (next < spine_.size() && xml::attribute(child, "idref") == spine_[next].idref) {
            ++next;
            last_ref = child;
        } else {
            xml::remove_node(child);
        }
    }

    for (; next < spine_.size(); ++next) {
        xmlNode* node = xmlNewDocNode(doc_, spine_node_->ns, reinterpret_cast<const xmlChar*>("itemref"), nullptr);
        set_attribute(doc_, node, "idref", spine_[next].idref);
        for (const auto& [name, value] : spine_[next].extra_attributes) {
            set_attribute(doc_, node, name, value);
        }
        last_ref = insert_after(spine_node_, last_ref, node);
    }
}

std::string PackageDocument::serialize() {
    sync_manifest();
    sync_spine();
    return xml::dump_xml(doc_);
}

void PackageDocument::save() {
    Logger::log(LogLevel::Info, "Saving package document: " + path_.filename().string(), package_tag());
    try {
        write_file(path_, serialize());
    } catch (const std::runtime_error& e) {
        throw ContainerIOError(std::string("Failed to save package document (") + e.what() + ")", path_);
    }
}

fs::path locate_package_document(const fs::path& root) {
    const fs::path container_xml = root / "META-INF" / "container.xml";
    std::error_code ec;
    if (fs::is_regular_file(container_xml, ec)) {
        std::string error;
        if (auto doc = xml::read_xml_file(container_xml, error)) {
            const auto rootfiles = xml::collect_elements(xmlDocGetRootElement(doc.get()), [](const xmlNode* n) {
                return xml::is_element(n, "rootfile");
            });
            for (const xmlNode* rootfile : rootfiles) {
                const std::string full_path = xml::attribute(rootfile, "full-path");
                const std::string media_type = xml::attribute(rootfile, "media-type");
                if (full_path.empty()) continue;
                if (!media_type.empty() && media_type != "application/oebps-package+xml") continue;

                const fs::path candidate = (root / fs::path(percent_decode(full_path)).relative_path()).lexically_normal();
                const auto rel = candidate.lexically_relative(root.lexically_normal());
                if (rel.empty() || *rel.begin() == "..") continue;
                if (fs::is_regular_file(candidate, ec)) {
                    Logger::log(LogLevel::Debug, "Found OPF at: " + candidate.string(), package_tag());
                    return candidate;
                }
            }
            Logger::log(LogLevel::Warning, "container.xml names no usable rootfile, searching for *.opf",
                        package_tag());
        } else {
            Logger::log(LogLevel::Warning, "Failed to parse container.xml (" + error + "), searching for *.opf",
                        package_tag());
        }
    }

    std::vector<fs::path> candidates;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && to_lower_copy(it->path().extension().string()) == ".opf") {
            candidates.push_back(it->path());
        }
    }
    if (candidates.empty()) {
        throw MalformedPackageError("No .opf file found in EPUB", root);
    }
    std::sort(candidates.begin(), candidates.end());
    Logger::log(LogLevel::Debug, "Found OPF at: " + candidates.front().string(), package_tag());
    return candidates.front();
}

} // namespace inkpress
