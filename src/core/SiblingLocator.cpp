#include "SiblingLocator.h"
#include "NodeClassifier.h"
#include "PathError.h"

#include <utility>

namespace xpathgen {

// ============================================================================
// SiblingSnapshot
// ============================================================================

SiblingSnapshot SiblingSnapshot::of(const XmlNode* node) {
    if (node == nullptr) {
        throw InvalidArgumentError("SiblingLocator: node cannot be null");
    }
    if (node->parent == nullptr) {
        throw InvalidArgumentError("SiblingLocator: " + std::string(nodeTypeNames[node->type]) +
                                   " node '" + node->name + "' has no parent");
    }

    const XmlNode* parent = node->parent;
    std::vector<const XmlNode*> siblings;
    siblings.reserve(parent->children.size());

    size_t position = 0;
    bool found = false;
    for (const auto& child : parent->children) {
        if (child.get() == node) {
            position = siblings.size();
            found = true;
        }
        siblings.push_back(child.get());
    }

    if (!found) {
        throw InvalidArgumentError("SiblingLocator: node '" + node->name +
                                   "' is not among its parent's children");
    }

    return SiblingSnapshot(std::move(siblings), position);
}

SiblingSnapshot::SiblingSnapshot(std::vector<const XmlNode*> siblings, size_t position)
    : siblings_(std::move(siblings)), position_(position) {
    if (position_ >= siblings_.size()) {
        throw InvalidArgumentError("SiblingLocator: snapshot position out of range");
    }
    for (const XmlNode* sibling : siblings_) {
        if (sibling == nullptr) {
            throw InvalidArgumentError("SiblingLocator: snapshot contains a null sibling");
        }
    }
}

bool SiblingSnapshot::countable(size_t i) const {
    const XmlNode* cur = siblings_[i];

    if (NodeClassifier::isEmptyText(cur)) {
        return false;
    }
    if (cur->type == NODE_DOCUMENT_TYPE) {
        return false;
    }
    // Adjacent text and CDATA nodes coalesce into the run's first node.
    return !(NodeClassifier::isText(cur) && continuesTextRun(i));
}

// Zero-length text nodes don't exist in the XPath data model, so they
// neither start nor break a run: "x", "", "y" is one run while <e/>, "", "y"
// starts a new one at "y".
bool SiblingSnapshot::continuesTextRun(size_t i) const {
    while (i > 0) {
        const XmlNode* prev = siblings_[--i];
        if (!NodeClassifier::isEmptyText(prev)) {
            return NodeClassifier::isText(prev);
        }
    }
    return false;
}

// ============================================================================
// SiblingLocator
// ============================================================================

SiblingLocator::SiblingLocator(const XmlNode* node)
    : snapshot_(SiblingSnapshot::of(node)) {
}

SiblingLocator::SiblingLocator(SiblingSnapshot snapshot)
    : snapshot_(std::move(snapshot)) {
}

const SiblingIndex& SiblingLocator::index() const {
    if (!cached_) {
        SiblingIndex idx;
        idx.childNumber = computeChildNumber();
        if (NodeClassifier::isText(snapshot_.target())) {
            idx.charOffset = computeCharOffset();
        }
        cached_ = idx;
    }
    return *cached_;
}

SiblingIndex SiblingLocator::indexOf(const XmlNode* node) {
    return SiblingLocator(node).index();
}

// Counts the logical nodes that start before the target. A target that is
// not countable itself shares the number of the run it continues.
// A zero-length text node with no countable predecessor comes out as 0:
// it has no XPath representation and callers must not evaluate it.
int SiblingLocator::computeChildNumber() const {
    int childNo = 1;
    const size_t target = snapshot_.position();

    for (size_t i = 0; i < target; ++i) {
        if (snapshot_.countable(i)) {
            ++childNo;
        }
    }
    if (!snapshot_.countable(target)) {
        --childNo;
    }
    return childNo;
}

int SiblingLocator::computeCharOffset() const {
    const auto& siblings = snapshot_.siblings();
    size_t offset = 1;

    for (size_t i = snapshot_.position(); i > 0; --i) {
        const XmlNode* prev = siblings[i - 1];
        if (!NodeClassifier::isText(prev)) {
            break;
        }
        offset += NodeClassifier::textLength(prev);
    }
    return static_cast<int>(offset);
}

} // namespace xpathgen
