#include "PathResolver.h"
#include "PathError.h"
#include "SiblingLocator.h"

#include <cctype>
#include <utility>

namespace xpathgen {

static constexpr const char* CHILD_STEP_PREFIX = "node()[";
static constexpr size_t MAX_INDEX_DIGITS = 9;

std::vector<PathStep> PathResolver::parse(const std::string& path) {
    if (path.empty() || path[0] != '/') {
        throw InvalidArgumentError("PathResolver: path must start with '/': '" + path + "'");
    }

    std::vector<PathStep> steps;
    if (path == "/") {
        return steps;
    }

    size_t start = 1;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        steps.push_back(parseStep(path, path.substr(start, slash - start)));
        start = slash + 1;
    }
    return steps;
}

PathStep PathResolver::parseStep(const std::string& path, const std::string& step) {
    PathStep result;

    if (!step.empty() && step[0] == '@') {
        result.kind = PathStep::ATTRIBUTE;
        result.name = step.substr(1);
        if (result.name.empty()) {
            throw InvalidArgumentError("PathResolver: empty attribute name in '" + path + "'");
        }
        for (char c : result.name) {
            if (std::isspace(static_cast<unsigned char>(c)) || c == '[' || c == ']') {
                throw InvalidArgumentError("PathResolver: bad attribute name in '" + path + "'");
            }
        }
        return result;
    }

    const std::string prefix = CHILD_STEP_PREFIX;
    if (step.size() <= prefix.size() + 1 || step.compare(0, prefix.size(), prefix) != 0 ||
        step.back() != ']') {
        throw InvalidArgumentError("PathResolver: bad step '" + step + "' in '" + path + "'");
    }

    std::string digits = step.substr(prefix.size(), step.size() - prefix.size() - 1);
    if (digits.empty() || digits.size() > MAX_INDEX_DIGITS || digits[0] == '0') {
        throw InvalidArgumentError("PathResolver: bad index in step '" + step + "'");
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidArgumentError("PathResolver: bad index in step '" + step + "'");
        }
    }

    result.kind = PathStep::CHILD;
    result.childNumber = std::stoi(digits);
    return result;
}

const XmlNode* PathResolver::resolve(const XmlNode* document, const std::string& path) {
    if (document == nullptr || !document->isDocument()) {
        throw InvalidArgumentError("PathResolver: paths are resolved from a document node");
    }

    const XmlNode* cur = document;
    for (const PathStep& step : parse(path)) {
        if (cur == nullptr) {
            break;
        }
        if (step.kind == PathStep::ATTRIBUTE) {
            cur = cur->isElement() ? cur->attribute(step.name) : nullptr;
        } else {
            cur = nthChild(cur, step.childNumber);
        }
    }
    return cur;
}

const XmlNode* PathResolver::nthChild(const XmlNode* parent, int childNumber) {
    if (parent == nullptr || parent->children.empty() || childNumber < 1) {
        return nullptr;
    }

    std::vector<const XmlNode*> children;
    children.reserve(parent->children.size());
    for (const auto& child : parent->children) {
        children.push_back(child.get());
    }

    SiblingSnapshot snapshot(std::move(children), 0);
    int count = 0;
    for (size_t i = 0; i < snapshot.size(); ++i) {
        if (snapshot.countable(i) && ++count == childNumber) {
            return snapshot.siblings()[i];
        }
    }
    return nullptr;
}

} // namespace xpathgen
