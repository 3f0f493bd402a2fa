#include "scigraph/core/error.h"

namespace scigraph {
namespace core {

const char* ErrorCodeName(Error::Code code) {
    switch (code) {
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
        case Error::Code::QUERY_EXECUTION: return "QUERY_EXECUTION";
        case Error::Code::SCHEMA: return "SCHEMA";
        case Error::Code::CACHE_CORRUPTION: return "CACHE_CORRUPTION";
        case Error::Code::INTERNAL: return "INTERNAL";
        case Error::Code::UNKNOWN:
        default:
            return "UNKNOWN";
    }
}

} // namespace core
} // namespace scigraph
