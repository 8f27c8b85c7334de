#pragma once

#include "XmlNode.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace xpathgen {

// ============================================================================
// SiblingSnapshot - immutable copy of a parent's ordered child list
// ============================================================================

// Captures the parent's children at construction time. Later mutations of
// the tree are not observed: a snapshot taken before a mutation is stale and
// must not be used to answer queries about the mutated tree.
class SiblingSnapshot {
public:
    // Throws InvalidArgumentError if node is null, parentless, or not found
    // among its parent's children.
    static SiblingSnapshot of(const XmlNode* node);

    // Build directly from a child list. position must index the target.
    SiblingSnapshot(std::vector<const XmlNode*> siblings, size_t position);

    const std::vector<const XmlNode*>& siblings() const { return siblings_; }
    size_t position() const { return position_; }
    const XmlNode* target() const { return siblings_[position_]; }
    size_t size() const { return siblings_.size(); }

    // True if sibling i starts a logical node() under XPath addressing.
    // Continuations of a text run, zero-length text and doctypes don't.
    bool countable(size_t i) const;

    // True if a text-like sibling i continues a run started before it.
    bool continuesTextRun(size_t i) const;

private:
    std::vector<const XmlNode*> siblings_;
    size_t position_ = 0;
};

// ============================================================================
// SiblingIndex - node() child number and char offset of one node
// ============================================================================

struct SiblingIndex {
    int childNumber = 0;

    // 1-based start of the node's content within its merged text run.
    // Only set for text and CDATA nodes.
    std::optional<int> charOffset;
};

// ============================================================================
// SiblingLocator - XPath node() index of a node among its siblings
// ============================================================================

class SiblingLocator {
public:
    // Snapshots node's siblings. Throws InvalidArgumentError if node is
    // null or has no parent.
    explicit SiblingLocator(const XmlNode* node);

    explicit SiblingLocator(SiblingSnapshot snapshot);

    // Computed once per locator and memoized.
    const SiblingIndex& index() const;

    int childNumber() const { return index().childNumber; }
    std::optional<int> charOffset() const { return index().charOffset; }

    const SiblingSnapshot& snapshot() const { return snapshot_; }

    // Convenience for one-off lookups.
    static SiblingIndex indexOf(const XmlNode* node);

private:
    int computeChildNumber() const;
    int computeCharOffset() const;

    SiblingSnapshot snapshot_;
    mutable std::optional<SiblingIndex> cached_;
};

} // namespace xpathgen
