#pragma once

#include "XmlNode.h"

#include <cstddef>
#include <string>

namespace xpathgen {

// ============================================================================
// NodeClassifier - node predicates shared by the locator, the path builder
// and callers. All functions accept nullptr.
// ============================================================================

namespace NodeClassifier {

// True for text and CDATA nodes.
bool isText(const XmlNode* node);

// True for a text node with zero-length content. CDATA is never "empty text".
bool isEmptyText(const XmlNode* node);

// True for xmlns / xmlns:p declarations, whether or not the tree was built
// with namespace awareness.
bool isNamespaceAttribute(const XmlNode* node);

// Local name, or the qualified name when no local name was recorded.
std::string localName(const XmlNode* node);

// Length of the node's content in characters (UTF-8 code points).
size_t textLength(const XmlNode* node);

// Character count of a UTF-8 string. Continuation bytes are not counted.
size_t utf8Length(const std::string& s);

} // namespace NodeClassifier

} // namespace xpathgen
