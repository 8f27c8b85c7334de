#pragma once

#include "XmlNode.h"

#include <optional>
#include <string>

namespace xpathgen {

// ============================================================================
// TextLocation - where a text node's own content sits in its merged run
// ============================================================================

struct TextLocation {
    std::string path;   // path of the merged run
    int charOffset = 1; // 1-based start of this node's content
    int length = 0;     // length of this node's content in characters
};

// ============================================================================
// PathBuilder - unique positional XPath for a node
// ============================================================================

// Paths use node() steps at every level and "@name" for attributes, e.g.
// "/node()[1]/node()[2]/@attr". For text nodes the path addresses the whole
// coalesced text run; use getTextLocation() to pin down the node's part.
//
// Paths are valid only until the tree is mutated.
class PathBuilder {
public:
    // Throws InvalidArgumentError for null or parentless nodes,
    // UnaddressableError for document types, DetachedNodeError for
    // attributes without an owner element.
    static std::string getPath(const XmlNode* node);

    // Path plus char offset and length. Throws InvalidArgumentError if
    // node is not a text or CDATA node.
    static TextLocation getTextLocation(const XmlNode* node);

private:
    PathBuilder() = delete;

    static std::string childStep(const XmlNode* node);
};

} // namespace xpathgen
