#pragma once

#include "Types.h"

#include <memory>
#include <string>
#include <vector>

namespace xpathgen {

// ============================================================================
// XmlNode - unified read-mostly XML tree node
// ============================================================================

class XmlNode {
public:
    XmlNode() = default;
    XmlNode(NodeType type, std::string name, std::string content = std::string());

    NodeType type = NODE_ELEMENT;

    // Qualified name ("p:local"). Text-like nodes use the DOM names
    // ("#text", "#cdata-section", "#comment"); PIs use their target.
    std::string name;

    // Empty when the tree was built without namespace awareness.
    std::string localName;
    std::string namespaceUri;

    // Character data for text, CDATA, comments, PIs and attribute values.
    std::string content;

    // Tree structure. Attributes have no parent; they point at ownerElement.
    XmlNode* parent = nullptr;
    XmlNode* ownerElement = nullptr;
    std::vector<std::unique_ptr<XmlNode>> children;
    std::vector<std::unique_ptr<XmlNode>> attributes;

    // --- Inline helpers ---

    bool isDocument() const { return type == NODE_DOCUMENT; }
    bool isElement() const { return type == NODE_ELEMENT; }
    bool isAttribute() const { return type == NODE_ATTRIBUTE; }

    size_t childCount() const { return children.size(); }
    size_t attributeCount() const { return attributes.size(); }

    XmlNode* child(size_t i) const { return i < children.size() ? children[i].get() : nullptr; }

    // --- Methods implemented in .cpp ---

    // Add a child node; sets child's parent pointer. Returns raw pointer.
    XmlNode* addChild(std::unique_ptr<XmlNode> child);

    // Add an attribute; sets its owner element. Returns raw pointer.
    XmlNode* addAttribute(std::unique_ptr<XmlNode> attr);

    // Detach and return the child at index i (nullptr if out of range).
    std::unique_ptr<XmlNode> removeChild(size_t i);

    // Position of a direct child in children, or -1.
    int indexOfChild(const XmlNode* node) const;

    // First attribute whose qualified name matches, or nullptr.
    XmlNode* attribute(const std::string& qname) const;

    // Walk parent pointers up to the document (nullptr if detached).
    const XmlNode* ownerDocument() const;

    // --- Factories ---

    static std::unique_ptr<XmlNode> makeDocument();
    static std::unique_ptr<XmlNode> makeDocumentType(const std::string& name);
    static std::unique_ptr<XmlNode> makeElement(const std::string& qname,
                                                const std::string& nsUri = std::string());
    static std::unique_ptr<XmlNode> makeAttribute(const std::string& qname,
                                                  const std::string& value,
                                                  const std::string& nsUri = std::string());
    static std::unique_ptr<XmlNode> makeText(const std::string& text);
    static std::unique_ptr<XmlNode> makeCData(const std::string& text);
    static std::unique_ptr<XmlNode> makeComment(const std::string& text);
    static std::unique_ptr<XmlNode> makeProcessingInstruction(const std::string& target,
                                                              const std::string& data);
};

} // namespace xpathgen
