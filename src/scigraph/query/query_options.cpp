#include "scigraph/query/query_options.h"

namespace scigraph {
namespace query {

const char* ToString(TrendMetric metric) {
    switch (metric) {
        case TrendMetric::CITATIONS: return "citations";
        case TrendMetric::PATENTS: return "patents";
        case TrendMetric::COUNT:
        default:
            return "count";
    }
}

TrendMetric ParseTrendMetric(const std::string& name) {
    if (name == "citations") {
        return TrendMetric::CITATIONS;
    }
    if (name == "patents") {
        return TrendMetric::PATENTS;
    }
    return TrendMetric::COUNT;
}

} // namespace query
} // namespace scigraph
