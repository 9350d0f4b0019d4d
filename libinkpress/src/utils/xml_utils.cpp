#include "../../include/xml_utils.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlsave.h>
#include <cctype>

namespace inkpress::xml {

namespace {

const char* as_chars(const xmlChar* s) {
    return reinterpret_cast<const char*>(s);
}

const xmlChar* as_xml(const char* s) {
    return reinterpret_cast<const xmlChar*>(s);
}

bool equals(const std::string_view a, const std::string_view b, const bool ignore_case) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (ignore_case ? std::tolower(ca) != std::tolower(cb) : ca != cb) return false;
    }
    return true;
}

bool is_whitespace_text(const xmlNode* node) {
    if (!node || node->type != XML_TEXT_NODE) return false;
    if (!node->content) return true;
    for (const xmlChar* p = node->content; *p; ++p) {
        if (!std::isspace(*p)) return false;
    }
    return true;
}

void collect_text(const xmlNode* node, std::string& out) {
    for (const xmlNode* child = node->children; child; child = child->next) {
        if ((child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) && child->content) {
            out += as_chars(child->content);
        } else if (child->type == XML_ELEMENT_NODE) {
            collect_text(child, out);
        }
    }
}

// parser diagnostics go through last_error(), not to stderr
void ignore_generic_error(void*, const char*, ...) {}

void quiet_parser() {
    xmlSetGenericErrorFunc(nullptr, ignore_generic_error);
}

void collect(xmlNode* node, const std::function<bool(const xmlNode*)>& predicate, std::vector<xmlNode*>& out) {
    for (xmlNode* cur = node; cur; cur = cur->next) {
        if (cur->type != XML_ELEMENT_NODE) continue;
        if (predicate(cur)) out.push_back(cur);
        collect(cur->children, predicate, out);
    }
}

} // namespace

XmlDocPtr read_xml_file(const std::filesystem::path& path, std::string& error) {
    quiet_parser();
    xmlResetLastError();
    XmlDocPtr doc(xmlReadFile(path.string().c_str(), nullptr, XML_PARSE_NONET));
    if (!doc) {
        error = last_error();
    }
    return doc;
}

XmlDocPtr read_html_file(const std::filesystem::path& path, std::string& error) {
    quiet_parser();
    xmlResetLastError();
    XmlDocPtr doc(htmlReadFile(path.string().c_str(), "UTF-8",
                               HTML_PARSE_RECOVER | HTML_PARSE_NONET |
                               HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING));
    if (!doc) {
        error = last_error();
    }
    return doc;
}

bool save_xml_file(const std::filesystem::path& path, xmlDoc* doc) {
    return xmlSaveFormatFileEnc(path.string().c_str(), doc, "UTF-8", 0) >= 0;
}

bool save_html_file(const std::filesystem::path& path, xmlDoc* doc) {
    return htmlSaveFileEnc(path.string().c_str(), doc, "UTF-8") >= 0;
}

std::string dump_xml(xmlDoc* doc) {
    xmlChar* buf = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc, &buf, &size, "UTF-8", 0);
    if (!buf) return {};
    std::string out(as_chars(buf), static_cast<size_t>(size));
    xmlFree(buf);
    return out;
}

bool is_element(const xmlNode* node, const std::string_view local_name, const bool ignore_case) {
    if (!node || node->type != XML_ELEMENT_NODE || !node->name) return false;
    return equals(as_chars(node->name), local_name, ignore_case);
}

std::string_view namespace_of(const xmlNode* node) {
    if (!node || !node->ns || !node->ns->href) return {};
    return as_chars(node->ns->href);
}

std::string attribute(const xmlNode* node, const std::string_view name) {
    if (!node || node->type != XML_ELEMENT_NODE) return {};
    for (const xmlAttr* attr = node->properties; attr; attr = attr->next) {
        if (attr->name && equals(as_chars(attr->name), name, false)) {
            xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
            std::string out = value ? as_chars(value) : "";
            xmlFree(value);
            return out;
        }
    }
    return {};
}

std::string xlink_href(const xmlNode* node) {
    if (!node || node->type != XML_ELEMENT_NODE) return {};
    xmlChar* value = xmlGetNsProp(node, as_xml("href"), as_xml(kXlinkNamespace.data()));
    std::string out = value ? as_chars(value) : "";
    xmlFree(value);
    return out;
}

std::string text_content(const xmlNode* node) {
    std::string out;
    if (node) collect_text(node, out);
    return out;
}

void set_text(xmlNode* element, const std::string_view text) {
    xmlNode* child = element->children;
    while (child) {
        xmlNode* next = child->next;
        xmlUnlinkNode(child);
        xmlFreeNode(child);
        child = next;
    }
    const std::string value(text);
    xmlAddChild(element, xmlNewDocText(element->doc, as_xml(value.c_str())));
}

bool is_blank(const xmlNode* element) {
    for (const xmlNode* child = element->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) return false;
        if ((child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) && !is_whitespace_text(child)) {
            return false;
        }
    }
    return true;
}

void remove_node(xmlNode* node) {
    if (!node) return;
    xmlNode* indent = node->prev;
    if (is_whitespace_text(indent)) {
        xmlUnlinkNode(indent);
        xmlFreeNode(indent);
    }
    xmlUnlinkNode(node);
    xmlFreeNode(node);
}

std::vector<xmlNode*> collect_elements(xmlNode* root,
                                       const std::function<bool(const xmlNode*)>& predicate) {
    std::vector<xmlNode*> out;
    if (!root) return out;
    if (root->type == XML_ELEMENT_NODE && predicate(root)) out.push_back(root);
    collect(root->children, predicate, out);
    return out;
}

std::vector<xmlNode*> element_children(xmlNode* node) {
    std::vector<xmlNode*> out;
    if (!node) return out;
    for (xmlNode* child = node->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) out.push_back(child);
    }
    return out;
}

std::string last_error() {
    const xmlError* err = xmlGetLastError();
    if (!err || !err->message) return "unknown XML error";
    std::string msg = err->message;
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
    if (err->line > 0) {
        msg += " (line " + std::to_string(err->line) + ")";
    }
    return msg;
}

} // namespace inkpress::xml
