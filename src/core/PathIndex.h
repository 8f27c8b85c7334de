#pragma once

#include "XmlNode.h"

#include <string>
#include <unordered_map>

namespace xpathgen {

// ============================================================================
// PathIndex - path <-> node lookup tables for one document
// ============================================================================

// A snapshot of the document's addressable nodes. Rebuild after mutating
// the tree; lookups on a stale index return stale answers.
class PathIndex {
public:
    PathIndex() = default;
    explicit PathIndex(const XmlNode* document);

    // Build the lookup tables. Throws InvalidArgumentError if document is
    // not a document node.
    void build(const XmlNode* document);

    // Drop the tables.
    void clear();

    // First node registered under path (the start of a coalesced text run),
    // or nullptr.
    const XmlNode* nodeByPath(const std::string& path) const;

    // Stored path of node, or an empty string for unregistered nodes
    // (document types, zero-length text, nodes of other documents).
    std::string pathOf(const XmlNode* node) const;

    bool contains(const XmlNode* node) const { return nodeTable_.count(node) != 0; }

    // Number of registered nodes (attributes and the document included).
    size_t size() const { return nodeTable_.size(); }

    // Number of distinct paths. Smaller than size() when text runs coalesce.
    size_t pathCount() const { return pathTable_.size(); }

private:
    // Recursive helper for build.
    void visit(const XmlNode* node, const std::string& path);

    void registerNode(const XmlNode* node, const std::string& path);

    std::unordered_map<const XmlNode*, std::string> nodeTable_;
    std::unordered_map<std::string, const XmlNode*> pathTable_;
};

} // namespace xpathgen
