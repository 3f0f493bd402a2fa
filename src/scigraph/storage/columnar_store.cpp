#include "scigraph/storage/columnar_store.h"

namespace scigraph {
namespace storage {

namespace {

std::string Quote(const std::string& text, char quote) {
    std::string out;
    out.reserve(text.size() + 2);
    out += quote;
    for (char c : text) {
        if (c == quote) {
            out += quote;
        }
        out += c;
    }
    out += quote;
    return out;
}

} // namespace

std::string QuoteLiteral(const std::string& value) {
    return Quote(value, '\'');
}

std::string QuoteIdentifier(const std::string& name) {
    return Quote(name, '"');
}

std::string ReadParquet(const std::string& path) {
    return "read_parquet(" + QuoteLiteral(path) + ")";
}

} // namespace storage
} // namespace scigraph
