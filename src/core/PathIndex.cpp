#include "PathIndex.h"
#include "NodeClassifier.h"
#include "PathError.h"
#include "SiblingLocator.h"

#include <utility>
#include <vector>

namespace xpathgen {

PathIndex::PathIndex(const XmlNode* document) {
    build(document);
}

void PathIndex::build(const XmlNode* document) {
    if (document == nullptr || !document->isDocument()) {
        throw InvalidArgumentError("PathIndex: index must be built from a document node");
    }

    nodeTable_.clear();
    pathTable_.clear();
    visit(document, "/");
}

void PathIndex::clear() {
    nodeTable_.clear();
    pathTable_.clear();
}

const XmlNode* PathIndex::nodeByPath(const std::string& path) const {
    auto it = pathTable_.find(path);
    if (it != pathTable_.end()) {
        return it->second;
    }
    return nullptr;
}

std::string PathIndex::pathOf(const XmlNode* node) const {
    auto it = nodeTable_.find(node);
    if (it != nodeTable_.end()) {
        return it->second;
    }
    return std::string();
}

// Child numbers for a whole sibling list come out of one pass: a countable
// child opens a new logical node, any other child shares the current one.
// This matches SiblingLocator's per-node arithmetic.
void PathIndex::visit(const XmlNode* node, const std::string& path) {
    registerNode(node, path);

    for (const auto& attr : node->attributes) {
        registerNode(attr.get(), path + "/@" + attr->name);
    }

    if (node->children.empty()) {
        return;
    }

    std::vector<const XmlNode*> children;
    children.reserve(node->children.size());
    for (const auto& child : node->children) {
        children.push_back(child.get());
    }
    SiblingSnapshot snapshot(std::move(children), 0);

    const std::string base = node->isDocument() ? std::string() : path;
    int childNo = 0;
    for (size_t i = 0; i < snapshot.size(); ++i) {
        const XmlNode* child = snapshot.siblings()[i];
        if (snapshot.countable(i)) {
            ++childNo;
        }
        if (child->type == NODE_DOCUMENT_TYPE || NodeClassifier::isEmptyText(child)) {
            continue;
        }
        visit(child, base + "/node()[" + std::to_string(childNo) + "]");
    }
}

void PathIndex::registerNode(const XmlNode* node, const std::string& path) {
    nodeTable_[node] = path;
    // First registration wins: a text run is found through its first node.
    pathTable_.emplace(path, node);
}

} // namespace xpathgen
