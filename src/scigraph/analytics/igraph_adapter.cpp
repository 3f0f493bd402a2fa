#include "scigraph/analytics/igraph_adapter.hpp"
#include <mutex>
#include "scigraph/core/error.h"

namespace scigraph {
namespace analytics {

void InitIGraph() {
    static std::once_flag once;
    std::call_once(once, []() {
        igraph_set_error_handler(igraph_error_handler_ignore);
        igraph_set_warning_handler(igraph_warning_handler_ignore);
    });
}

core::Result<void> CheckIGraph(igraph_error_t status, const std::string& what) {
    if (status == IGRAPH_SUCCESS) {
        return core::Result<void>();
    }
    return core::Result<void>::error(what + " failed: " + igraph_strerror(status),
                                     core::Error::Code::INTERNAL);
}

IGraphVector::IGraphVector(igraph_integer_t size) {
    InitIGraph();
    if (igraph_vector_init(&vector_, size) != IGRAPH_SUCCESS) {
        throw core::InternalError("Cannot allocate igraph vector of " + std::to_string(size));
    }
}

IGraphVector::~IGraphVector() {
    igraph_vector_destroy(&vector_);
}

std::vector<double> IGraphVector::values() const {
    std::vector<double> out(static_cast<size_t>(size()));
    for (igraph_integer_t i = 0; i < size(); ++i) {
        out[static_cast<size_t>(i)] = VECTOR(vector_)[i];
    }
    return out;
}

IGraphIntVector::IGraphIntVector(igraph_integer_t size) {
    InitIGraph();
    if (igraph_vector_int_init(&vector_, size) != IGRAPH_SUCCESS) {
        throw core::InternalError("Cannot allocate igraph vector of " + std::to_string(size));
    }
}

IGraphIntVector::~IGraphIntVector() {
    igraph_vector_int_destroy(&vector_);
}

IGraphHandle::IGraphHandle(const graph::Graph& graph) {
    const size_t n = graph.node_count();
    IGraphIntVector endpoints;
    for (size_t u = 0; u < n; ++u) {
        for (const auto& entry : graph.out_neighbors(u)) {
            if (!graph.directed() && entry.first < u) {
                continue;
            }
            const auto source = static_cast<igraph_integer_t>(u);
            const auto target = static_cast<igraph_integer_t>(entry.first);
            if (igraph_vector_int_push_back(endpoints.get(), source) != IGRAPH_SUCCESS ||
                igraph_vector_int_push_back(endpoints.get(), target) != IGRAPH_SUCCESS ||
                igraph_vector_push_back(weights_.get(), static_cast<igraph_real_t>(entry.second)) != IGRAPH_SUCCESS) {
                throw core::InternalError("Cannot allocate igraph edge list");
            }
        }
    }

    auto created = CheckIGraph(igraph_create(&graph_, endpoints.get(), static_cast<igraph_integer_t>(n),
                                             graph.directed() ? IGRAPH_DIRECTED : IGRAPH_UNDIRECTED),
                               "igraph_create");
    if (!created.ok()) {
        throw core::InternalError(created.error());
    }
}

IGraphHandle::~IGraphHandle() {
    igraph_destroy(&graph_);
}

} // namespace analytics
} // namespace scigraph
