#include "NodeClassifier.h"

namespace xpathgen {
namespace NodeClassifier {

bool isText(const XmlNode* node) {
    return node != nullptr && (node->type == NODE_TEXT || node->type == NODE_CDATA);
}

bool isEmptyText(const XmlNode* node) {
    return node != nullptr && node->type == NODE_TEXT && node->content.empty();
}

bool isNamespaceAttribute(const XmlNode* node) {
    if (node == nullptr) {
        return false;
    }

    if (!node->namespaceUri.empty()) {
        return node->namespaceUri == XMLNS_NAMESPACE || node->localName == XMLNS_PREFIX;
    }

    // Not namespace aware: only the default declaration is recognisable by name.
    return node->name == XMLNS_PREFIX;
}

std::string localName(const XmlNode* node) {
    if (node == nullptr) {
        return std::string();
    }
    return node->localName.empty() ? node->name : node->localName;
}

size_t textLength(const XmlNode* node) {
    return node != nullptr ? utf8Length(node->content) : 0;
}

size_t utf8Length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace NodeClassifier
} // namespace xpathgen
