#pragma once

#include "XmlNode.h"

#include <string>
#include <vector>

namespace xpathgen {

// ============================================================================
// PathStep - one parsed location step
// ============================================================================

struct PathStep {
    enum Kind { CHILD, ATTRIBUTE };

    Kind kind = CHILD;
    int childNumber = 0;    // CHILD: 1-based node() position
    std::string name;       // ATTRIBUTE: qualified attribute name
};

// ============================================================================
// PathResolver - evaluate a generated path against a tree
// ============================================================================

// Understands exactly the paths PathBuilder produces. node()[k] selects the
// first physical node of the k-th logical child, so text paths land on the
// start of the coalesced run.
class PathResolver {
public:
    // Throws InvalidArgumentError if path does not match
    //   "/" | "/" Step ("/" Step)*   with Step := node()[N] | @Name
    static std::vector<PathStep> parse(const std::string& path);

    // nullptr if no node sits at that position. Throws InvalidArgumentError
    // if document is not a document node or path is malformed.
    static const XmlNode* resolve(const XmlNode* document, const std::string& path);

    // n-th logical child (1-based) of a document or element, or nullptr.
    static const XmlNode* nthChild(const XmlNode* parent, int childNumber);

private:
    PathResolver() = delete;

    static PathStep parseStep(const std::string& path, const std::string& step);
};

} // namespace xpathgen
