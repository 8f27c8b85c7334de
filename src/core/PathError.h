#pragma once

#include "Types.h"

#include <stdexcept>
#include <string>

namespace xpathgen {

// ============================================================================
// PathError - failures raised by a single path computation
// ============================================================================

class PathError : public std::runtime_error {
public:
    PathError(PathErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    PathErrorCode code() const { return code_; }
    const char* codeName() const { return pathErrorNames[code_]; }

private:
    PathErrorCode code_;
};

// Null node, node without parent context, or a malformed path.
class InvalidArgumentError : public PathError {
public:
    explicit InvalidArgumentError(const std::string& what)
        : PathError(PATH_INVALID_ARGUMENT, what) {}
};

// Document type nodes have no XPath representation.
class UnaddressableError : public PathError {
public:
    explicit UnaddressableError(const std::string& what)
        : PathError(PATH_UNADDRESSABLE, what) {}
};

// Attribute whose owner element cannot be resolved.
class DetachedNodeError : public PathError {
public:
    explicit DetachedNodeError(const std::string& what)
        : PathError(PATH_DETACHED_NODE, what) {}
};

} // namespace xpathgen
