#include "DomImporter.h"

#include <libxml/entities.h>
#include <libxml/parser.h>
#include <libxml/xmlerror.h>

#include <algorithm>
#include <iostream>
#include <utility>

namespace xpathgen {

static constexpr int MAX_IMPORT_DEPTH = 1024;

static std::string toString(const xmlChar* s) {
    return s != nullptr ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

int ImportStats::total() const {
    int sum = 0;
    for (int count : nodeCounts) {
        sum += count;
    }
    return sum;
}

xmlNodePtr ImportedDocument::sourceOf(const XmlNode* node) const {
    auto it = sources_.find(node);
    if (it != sources_.end()) {
        return it->second;
    }
    return nullptr;
}

// ============================================================================
// Parsing
// ============================================================================

int DomImporter::parserFlags() const {
    int flags = XML_PARSE_NONET;
    if (!options_.keepBlankText) {
        flags |= XML_PARSE_NOBLANKS;
    }
    if (options_.substituteEntities) {
        flags |= XML_PARSE_NOENT;
    }
    return flags;
}

ImportedDocument DomImporter::parseString(const std::string& xml) {
    const size_t limit = std::min(options_.maxInputSize, static_cast<size_t>(INT_MAX));
    if (xml.size() > limit) {
        throw ImportError("DomImporter: input of " + std::to_string(xml.size()) +
                          " bytes exceeds the limit of " + std::to_string(limit));
    }

    xmlResetLastError();
    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                                "memory.xml", nullptr, parserFlags()));
    if (!doc) {
        throw ImportError("DomImporter: failed to parse XML: " + lastErrorMessage());
    }
    return importDocument(std::move(doc));
}

ImportedDocument DomImporter::parseFile(const std::string& path) {
    xmlResetLastError();
    XmlDocPtr doc(xmlReadFile(path.c_str(), nullptr, parserFlags()));
    if (!doc) {
        throw ImportError("DomImporter: failed to parse " + path + ": " + lastErrorMessage());
    }
    return importDocument(std::move(doc));
}

std::string DomImporter::lastErrorMessage() {
    const xmlError* err = xmlGetLastError();
    if (err == nullptr || err->message == nullptr) {
        return "unknown error";
    }
    std::string msg = err->message;
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.pop_back();
    }
    if (err->line > 0) {
        msg += " (line " + std::to_string(err->line) + ")";
    }
    return msg;
}

// ============================================================================
// Import
// ============================================================================

ImportedDocument DomImporter::importDocument(XmlDocPtr doc) {
    if (!doc) {
        throw ImportError("DomImporter: no document to import");
    }

    ImportedDocument result;
    current_ = &result;

    result.root_ = XmlNode::makeDocument();
    result.stats_.nodeCounts[NODE_DOCUMENT]++;
    track(result.root_.get(), reinterpret_cast<xmlNodePtr>(doc.get()));

    try {
        importChildren(doc->children, result.root_.get(), 0);
    } catch (...) {
        current_ = nullptr;
        throw;
    }
    current_ = nullptr;
    result.doc_ = std::move(doc);

    if (options_.verbose) {
        const ImportStats& stats = result.stats_;
        std::cout << "DomImporter: imported " << stats.total() << " nodes";
        for (int i = 0; i < NUM_NODE_TYPES; ++i) {
            if (stats.nodeCounts[i] > 0) {
                std::cout << ", " << stats.nodeCounts[i] << " " << nodeTypePluralNames[i];
            }
        }
        std::cout << ", " << stats.skippedCount << " skipped" << std::endl;
    }

    return result;
}

void DomImporter::importChildren(xmlNodePtr first, XmlNode* dst, int depth) {
    if (depth >= MAX_IMPORT_DEPTH) {
        throw ImportError("DomImporter: document nesting exceeds " +
                          std::to_string(MAX_IMPORT_DEPTH) + " levels");
    }

    for (xmlNodePtr cur = first; cur != nullptr; cur = cur->next) {
        if (cur->type == XML_ENTITY_REF_NODE) {
            expandEntityReference(cur, dst, depth);
            continue;
        }

        std::unique_ptr<XmlNode> node = importNode(cur);
        if (!node) {
            continue;
        }

        XmlNode* raw = dst->addChild(std::move(node));
        track(raw, cur);
        current_->stats_.nodeCounts[raw->type]++;

        if (cur->type == XML_ELEMENT_NODE) {
            importAttributes(cur, raw);
            importChildren(cur->children, raw, depth + 1);
        }
    }
}

// XPath sees an entity reference as its replacement, so text around it stays
// one run and later siblings keep their positions.
void DomImporter::expandEntityReference(xmlNodePtr ref, XmlNode* dst, int depth) {
    xmlEntityPtr entity = xmlGetDocEntity(ref->doc, ref->name);
    if (entity != nullptr && entity->children != nullptr) {
        importChildren(entity->children, dst, depth + 1);
        return;
    }

    // External or unparsed entity: only its string value is known.
    xmlChar* content = xmlNodeGetContent(ref);
    XmlNode* raw = dst->addChild(XmlNode::makeText(toString(content)));
    if (content != nullptr) {
        xmlFree(content);
    }
    track(raw, ref);
    current_->stats_.nodeCounts[NODE_TEXT]++;
}

std::unique_ptr<XmlNode> DomImporter::importNode(xmlNodePtr src) {
    switch (src->type) {
        case XML_ELEMENT_NODE: {
            auto node = std::make_unique<XmlNode>(NODE_ELEMENT, std::string());
            applyName(node.get(), src->name, src->ns);
            return node;
        }
        case XML_TEXT_NODE:
            return XmlNode::makeText(toString(src->content));
        case XML_CDATA_SECTION_NODE:
            return XmlNode::makeCData(toString(src->content));
        case XML_COMMENT_NODE:
            return XmlNode::makeComment(toString(src->content));
        case XML_PI_NODE:
            return XmlNode::makeProcessingInstruction(toString(src->name), toString(src->content));
        case XML_DTD_NODE:
            return XmlNode::makeDocumentType(toString(src->name));
        default:
            break;
    }

    // XInclude markers and other kinds with no XPath counterpart.
    std::cerr << "DomImporter: skipping unsupported node type " << static_cast<int>(src->type);
    if (src->name != nullptr) {
        std::cerr << " '" << toString(src->name) << "'";
    }
    std::cerr << " at line " << xmlGetLineNo(src) << std::endl;
    current_->stats_.skippedCount++;
    return nullptr;
}

void DomImporter::importAttributes(xmlNodePtr src, XmlNode* element) {
    if (options_.keepNamespaceDecls) {
        for (xmlNsPtr ns = src->nsDef; ns != nullptr; ns = ns->next) {
            std::string prefix = toString(ns->prefix);
            std::string qname = prefix.empty() ? std::string(XMLNS_PREFIX)
                                               : std::string(XMLNS_PREFIX) + ":" + prefix;
            auto decl = std::make_unique<XmlNode>(NODE_ATTRIBUTE, qname, toString(ns->href));
            if (options_.namespaceAware) {
                decl->localName = prefix.empty() ? std::string(XMLNS_PREFIX) : prefix;
                decl->namespaceUri = XMLNS_NAMESPACE;
            }
            element->addAttribute(std::move(decl));
            current_->stats_.nodeCounts[NODE_ATTRIBUTE]++;
        }
    }

    for (xmlAttrPtr attr = src->properties; attr != nullptr; attr = attr->next) {
        auto node = std::make_unique<XmlNode>(NODE_ATTRIBUTE, std::string());
        applyName(node.get(), attr->name, attr->ns);

        xmlChar* value = xmlNodeListGetString(src->doc, attr->children, 1);
        node->content = toString(value);
        if (value != nullptr) {
            xmlFree(value);
        }

        XmlNode* raw = element->addAttribute(std::move(node));
        track(raw, reinterpret_cast<xmlNodePtr>(attr));
        current_->stats_.nodeCounts[NODE_ATTRIBUTE]++;
    }
}

void DomImporter::applyName(XmlNode* node, const xmlChar* name, xmlNsPtr ns) const {
    std::string local = toString(name);
    std::string prefix = ns != nullptr ? toString(ns->prefix) : std::string();

    node->name = prefix.empty() ? local : prefix + ":" + local;
    if (options_.namespaceAware) {
        node->localName = local;
        node->namespaceUri = ns != nullptr ? toString(ns->href) : std::string();
    }
}

void DomImporter::track(const XmlNode* node, xmlNodePtr src) {
    current_->sources_[node] = src;
}

} // namespace xpathgen
