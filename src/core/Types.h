#pragma once

namespace xpathgen {

// ============================================================================
// Enumerations
// ============================================================================

enum NodeType {
    NODE_DOCUMENT = 0,
    NODE_DOCUMENT_TYPE,
    NODE_ELEMENT,
    NODE_ATTRIBUTE,
    NODE_TEXT,
    NODE_CDATA,
    NODE_COMMENT,
    NODE_PROCESSING_INSTRUCTION,
    NUM_NODE_TYPES
};

enum PathErrorCode {
    PATH_INVALID_ARGUMENT = 0,
    PATH_UNADDRESSABLE,
    PATH_DETACHED_NODE
};

// ============================================================================
// Namespace constants
// ============================================================================

// Namespace reserved for namespace declaration attributes.
inline constexpr const char* XMLNS_NAMESPACE = "http://www.w3.org/2000/xmlns/";

inline constexpr const char* XMLNS_PREFIX = "xmlns";

// ============================================================================
// Node type name arrays
// ============================================================================

inline const char* const nodeTypeNames[] = {
    "Document",                 // NODE_DOCUMENT
    "Document type",            // NODE_DOCUMENT_TYPE
    "Element",                  // NODE_ELEMENT
    "Attribute",                // NODE_ATTRIBUTE
    "Text",                     // NODE_TEXT
    "CDATA section",            // NODE_CDATA
    "Comment",                  // NODE_COMMENT
    "Processing instruction"    // NODE_PROCESSING_INSTRUCTION
};

inline const char* const nodeTypePluralNames[] = {
    "Documents",                // NODE_DOCUMENT
    "Document types",           // NODE_DOCUMENT_TYPE
    "Elements",                 // NODE_ELEMENT
    "Attributes",               // NODE_ATTRIBUTE
    "Text nodes",               // NODE_TEXT
    "CDATA sections",           // NODE_CDATA
    "Comments",                 // NODE_COMMENT
    "Processing instructions"   // NODE_PROCESSING_INSTRUCTION
};

inline const char* const pathErrorNames[] = {
    "InvalidArgument",          // PATH_INVALID_ARGUMENT
    "Unaddressable",            // PATH_UNADDRESSABLE
    "DetachedNode"              // PATH_DETACHED_NODE
};

} // namespace xpathgen
