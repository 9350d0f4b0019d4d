/**
 * @file xml_utils.hpp
 * @brief Thin RAII and traversal helpers over libxml2.
 */

#ifndef INKPRESS_XML_UTILS_HPP
#define INKPRESS_XML_UTILS_HPP

#include <libxml/tree.h>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace inkpress::xml {

    inline constexpr std::string_view kOpfNamespace   = "http://www.idpf.org/2007/opf";
    inline constexpr std::string_view kNcxNamespace   = "http://www.daisy.org/z3986/2005/ncx/";
    inline constexpr std::string_view kXhtmlNamespace = "http://www.w3.org/1999/xhtml";
    inline constexpr std::string_view kSvgNamespace   = "http://www.w3.org/2000/svg";
    inline constexpr std::string_view kXlinkNamespace = "http://www.w3.org/1999/xlink";

    struct XmlDocDeleter {
        void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
    };
    using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

    /**
     * @brief Parses an XML file without network access, keeping whitespace.
     * @param path File to parse.
     * @param error Receives libxml2's last error message on failure.
     * @return The document, or nullptr if parsing failed.
     */
    XmlDocPtr read_xml_file(const std::filesystem::path& path, std::string& error);

    /**
     * @brief Parses an HTML file with the recovering HTML parser.
     * @return The document, or nullptr if parsing failed.
     */
    XmlDocPtr read_html_file(const std::filesystem::path& path, std::string& error);

    /// Saves an XML document as UTF-8 with an XML declaration. False on failure.
    bool save_xml_file(const std::filesystem::path& path, xmlDoc* doc);

    /// Saves an HTML document as UTF-8. False on failure.
    bool save_html_file(const std::filesystem::path& path, xmlDoc* doc);

    /// Serializes a whole XML document (declaration included) to a UTF-8 string.
    std::string dump_xml(xmlDoc* doc);

    /// Local (unprefixed) name comparison, ASCII case-insensitive when requested.
    bool is_element(const xmlNode* node, std::string_view local_name, bool ignore_case = false);

    /// Namespace URI of an element or attribute, empty when it has none.
    std::string_view namespace_of(const xmlNode* node);

    /// Attribute value by local name regardless of namespace, empty if absent.
    std::string attribute(const xmlNode* node, std::string_view name);

    /// Attribute value of the xlink:href attribute, empty if absent.
    std::string xlink_href(const xmlNode* node);

    /// Concatenated text of every descendant text/CDATA node.
    std::string text_content(const xmlNode* node);

    /// Replaces all children of an element by a single text node.
    void set_text(xmlNode* element, std::string_view text);

    /// True if the element has no element children and only whitespace text.
    bool is_blank(const xmlNode* element);

    /**
     * @brief Unlinks and frees a node, together with the whitespace-only text
     * node indenting it, so the serialized document keeps its layout.
     */
    void remove_node(xmlNode* node);

    /// Collects every element below (and including) root, in document order.
    std::vector<xmlNode*> collect_elements(xmlNode* root,
                                           const std::function<bool(const xmlNode*)>& predicate);

    /// Element children of a node, in document order.
    std::vector<xmlNode*> element_children(xmlNode* node);

    /// Last libxml2 error message, or "unknown XML error".
    std::string last_error();

} // namespace inkpress::xml

#endif // INKPRESS_XML_UTILS_HPP
