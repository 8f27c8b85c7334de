#include "PathBuilder.h"
#include "NodeClassifier.h"
#include "PathError.h"
#include "SiblingLocator.h"

namespace xpathgen {

std::string PathBuilder::getPath(const XmlNode* node) {
    if (node == nullptr) {
        throw InvalidArgumentError("PathBuilder: node cannot be null");
    }

    switch (node->type) {
        case NODE_ATTRIBUTE:
            // Attributes have no parent; address them through their element.
            if (node->ownerElement == nullptr) {
                throw DetachedNodeError("PathBuilder: attribute '" + node->name +
                                        "' has no owner element");
            }
            return getPath(node->ownerElement) + "/@" + node->name;

        case NODE_DOCUMENT:
            return "/";

        case NODE_DOCUMENT_TYPE:
            throw UnaddressableError("PathBuilder: document type '" + node->name +
                                     "' cannot be identified with XPath");

        case NODE_ELEMENT:
        case NODE_TEXT:
        case NODE_CDATA:
        case NODE_COMMENT:
        case NODE_PROCESSING_INSTRUCTION: {
            // Throws for parentless nodes before the parent is touched.
            std::string step = childStep(node);
            if (node->parent->isDocument()) {
                return step;
            }
            return getPath(node->parent) + step;
        }

        case NUM_NODE_TYPES:
            break;
    }

    throw InvalidArgumentError("PathBuilder: unknown node type " +
                               std::to_string(static_cast<int>(node->type)));
}

TextLocation PathBuilder::getTextLocation(const XmlNode* node) {
    if (!NodeClassifier::isText(node)) {
        throw InvalidArgumentError("PathBuilder: text location requested for a non-text node");
    }

    SiblingLocator locator(node);

    TextLocation loc;
    loc.path = getPath(node);
    loc.charOffset = locator.charOffset().value_or(1);
    loc.length = static_cast<int>(NodeClassifier::textLength(node));
    return loc;
}

std::string PathBuilder::childStep(const XmlNode* node) {
    return "/node()[" + std::to_string(SiblingLocator(node).childNumber()) + "]";
}

} // namespace xpathgen
