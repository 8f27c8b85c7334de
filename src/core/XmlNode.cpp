#include "XmlNode.h"

#include <cstddef>
#include <utility>

namespace xpathgen {

// Split "p:local" into its local part; unprefixed names are their own local name.
static std::string localPart(const std::string& qname) {
    auto colon = qname.find(':');
    if (colon == std::string::npos) {
        return qname;
    }
    return qname.substr(colon + 1);
}

XmlNode::XmlNode(NodeType type, std::string name, std::string content)
    : type(type), name(std::move(name)), content(std::move(content)) {
}

XmlNode* XmlNode::addChild(std::unique_ptr<XmlNode> child) {
    child->parent = this;
    XmlNode* raw = child.get();
    children.push_back(std::move(child));
    return raw;
}

XmlNode* XmlNode::addAttribute(std::unique_ptr<XmlNode> attr) {
    attr->ownerElement = this;
    attr->parent = nullptr;
    XmlNode* raw = attr.get();
    attributes.push_back(std::move(attr));
    return raw;
}

std::unique_ptr<XmlNode> XmlNode::removeChild(size_t i) {
    if (i >= children.size()) {
        return nullptr;
    }
    std::unique_ptr<XmlNode> removed = std::move(children[i]);
    children.erase(children.begin() + static_cast<std::ptrdiff_t>(i));
    removed->parent = nullptr;
    return removed;
}

int XmlNode::indexOfChild(const XmlNode* node) const {
    for (size_t i = 0; i < children.size(); ++i) {
        if (children[i].get() == node) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

XmlNode* XmlNode::attribute(const std::string& qname) const {
    for (const auto& attr : attributes) {
        if (attr->name == qname) {
            return attr.get();
        }
    }
    return nullptr;
}

const XmlNode* XmlNode::ownerDocument() const {
    const XmlNode* cur = isAttribute() ? ownerElement : this;
    while (cur != nullptr && !cur->isDocument()) {
        cur = cur->parent;
    }
    return cur;
}

// ============================================================================
// Factories
// ============================================================================

std::unique_ptr<XmlNode> XmlNode::makeDocument() {
    return std::make_unique<XmlNode>(NODE_DOCUMENT, "#document");
}

std::unique_ptr<XmlNode> XmlNode::makeDocumentType(const std::string& name) {
    auto node = std::make_unique<XmlNode>(NODE_DOCUMENT_TYPE, name);
    node->localName = name;
    return node;
}

std::unique_ptr<XmlNode> XmlNode::makeElement(const std::string& qname, const std::string& nsUri) {
    auto node = std::make_unique<XmlNode>(NODE_ELEMENT, qname);
    node->localName = localPart(qname);
    node->namespaceUri = nsUri;
    return node;
}

std::unique_ptr<XmlNode> XmlNode::makeAttribute(const std::string& qname,
                                                const std::string& value,
                                                const std::string& nsUri) {
    auto node = std::make_unique<XmlNode>(NODE_ATTRIBUTE, qname, value);
    node->localName = localPart(qname);
    node->namespaceUri = nsUri;
    return node;
}

std::unique_ptr<XmlNode> XmlNode::makeText(const std::string& text) {
    return std::make_unique<XmlNode>(NODE_TEXT, "#text", text);
}

std::unique_ptr<XmlNode> XmlNode::makeCData(const std::string& text) {
    return std::make_unique<XmlNode>(NODE_CDATA, "#cdata-section", text);
}

std::unique_ptr<XmlNode> XmlNode::makeComment(const std::string& text) {
    return std::make_unique<XmlNode>(NODE_COMMENT, "#comment", text);
}

std::unique_ptr<XmlNode> XmlNode::makeProcessingInstruction(const std::string& target,
                                                            const std::string& data) {
    auto node = std::make_unique<XmlNode>(NODE_PROCESSING_INSTRUCTION, target, data);
    node->localName = target;
    return node;
}

} // namespace xpathgen
