#include "scigraph/core/types.h"

#include <algorithm>
#include <cctype>

namespace scigraph {
namespace core {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string ToString(DocType doctype) {
    switch (doctype) {
        case DocType::ARTICLE: return "article";
        case DocType::OTHER:
        default:
            return "other";
    }
}

std::string ToString(AuthorPosition position) {
    switch (position) {
        case AuthorPosition::FIRST: return "first";
        case AuthorPosition::LAST: return "last";
        case AuthorPosition::MIDDLE:
        default:
            return "middle";
    }
}

DocType ParseDocType(const std::string& value) {
    return ToLower(value) == "article" ? DocType::ARTICLE : DocType::OTHER;
}

std::optional<AuthorPosition> ParseAuthorPosition(const std::string& value) {
    auto lowered = ToLower(value);
    if (lowered == "first") return AuthorPosition::FIRST;
    if (lowered == "middle") return AuthorPosition::MIDDLE;
    if (lowered == "last") return AuthorPosition::LAST;
    return std::nullopt;
}

} // namespace core
} // namespace scigraph
