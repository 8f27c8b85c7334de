#pragma once

#include "XmlNode.h"
#include "Types.h"

#include <libxml/tree.h>

#include <climits>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace xpathgen {

// ============================================================================
// Import options and statistics
// ============================================================================

struct ImportOptions {
    bool keepBlankText = true;        // false: XML_PARSE_NOBLANKS
    bool substituteEntities = true;   // XML_PARSE_NOENT
    bool keepNamespaceDecls = false;  // xmlns attributes become XmlNode attributes
    bool namespaceAware = true;       // false: no local names or namespace URIs
    bool verbose = false;
    size_t maxInputSize = INT_MAX;    // bytes; parseString rejects larger input
};

struct ImportStats {
    int nodeCounts[NUM_NODE_TYPES] = {};
    int skippedCount = 0;

    int total() const;
};

class ImportError : public std::runtime_error {
public:
    explicit ImportError(const std::string& what) : std::runtime_error(what) {}
};

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

// ============================================================================
// ImportedDocument - XmlNode tree plus the libxml2 document it came from
// ============================================================================

class ImportedDocument {
public:
    const XmlNode* document() const { return root_.get(); }
    XmlNode* document() { return root_.get(); }

    xmlDocPtr source() const { return doc_.get(); }

    // libxml2 node an XmlNode was built from, or nullptr (namespace
    // declaration attributes have no libxml2 node). Nodes spliced in from an
    // unsubstituted entity map to the entity's content nodes, or to the
    // reference itself when the entity has no parsed content.
    xmlNodePtr sourceOf(const XmlNode* node) const;

    const ImportStats& stats() const { return stats_; }

private:
    friend class DomImporter;

    XmlDocPtr doc_;
    std::unique_ptr<XmlNode> root_;
    std::unordered_map<const XmlNode*, xmlNodePtr> sources_;
    ImportStats stats_{};
};

// ============================================================================
// DomImporter - libxml2 document to XmlNode tree
// ============================================================================

class DomImporter {
public:
    DomImporter() = default;
    explicit DomImporter(const ImportOptions& options) : options_(options) {}

    // Parse xml text with libxml2 and import it. Throws ImportError.
    ImportedDocument parseString(const std::string& xml);

    // Parse a file with libxml2 and import it. Throws ImportError.
    ImportedDocument parseFile(const std::string& path);

    // Import a document already parsed by the caller. Takes ownership.
    ImportedDocument importDocument(XmlDocPtr doc);

    // libxml2 parser flags for the current options.
    int parserFlags() const;

    const ImportOptions& options() const { return options_; }

private:
    // Recursively import the sibling list starting at first below dst.
    void importChildren(xmlNodePtr first, XmlNode* dst, int depth);

    // Splice the replacement of an entity reference into dst.
    void expandEntityReference(xmlNodePtr ref, XmlNode* dst, int depth);

    // Build the XmlNode for one libxml2 node; nullptr for skipped kinds.
    std::unique_ptr<XmlNode> importNode(xmlNodePtr src);

    void importAttributes(xmlNodePtr src, XmlNode* element);

    void applyName(XmlNode* node, const xmlChar* name, xmlNsPtr ns) const;

    void track(const XmlNode* node, xmlNodePtr src);

    static std::string lastErrorMessage();

    ImportOptions options_;
    ImportedDocument* current_ = nullptr;
};

} // namespace xpathgen
