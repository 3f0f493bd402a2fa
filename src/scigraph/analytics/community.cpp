#include "scigraph/analytics/community.h"

#include <map>
#include <mutex>

#include "scigraph/analytics/igraph_adapter.hpp"
#include "scigraph/common/logger.h"
#include "scigraph/core/error.h"

namespace scigraph {
namespace analytics {

namespace {

// igraph's default generator is process-wide
std::mutex& RngMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

LouvainDetector::LouvainDetector(double resolution, uint64_t seed)
    : resolution_(resolution), seed_(seed) {}

core::Result<CommunityAssignment> LouvainDetector::detect(const graph::Graph& input) const {
    using R = core::Result<CommunityAssignment>;
    const graph::Graph graph = input.directed() ? input.to_undirected() : input;
    const size_t n = graph.node_count();
    CommunityAssignment assignment;
    if (n == 0) {
        return R(std::move(assignment));
    }

    IGraphHandle handle(graph);
    IGraphIntVector membership;
    igraph_error_t code;
    {
        std::lock_guard<std::mutex> lock(RngMutex());
        code = igraph_rng_seed(igraph_rng_default(), static_cast<igraph_uint_t>(seed_));
        if (code == IGRAPH_SUCCESS) {
            code = igraph_community_multilevel(handle.get(), handle.weights(), resolution_,
                                               membership.get(), nullptr, nullptr);
        }
    }
    auto status = CheckIGraph(code, "Louvain community detection");
    if (!status.ok()) {
        return R::error_from(status);
    }

    std::map<igraph_integer_t, int> dense;
    for (size_t i = 0; i < n; ++i) {
        const igraph_integer_t community = membership[static_cast<igraph_integer_t>(i)];
        assignment[graph.node_id(i)] = dense.emplace(community, static_cast<int>(dense.size())).first->second;
    }
    SCIGRAPH_DEBUG("Louvain: {} nodes in {} communities", n, dense.size());
    return R(std::move(assignment));
}

core::Result<CommunityAssignment> SingletonDetector::detect(const graph::Graph& graph) const {
    CommunityAssignment assignment;
    for (size_t i = 0; i < graph.node_count(); ++i) {
        assignment[graph.node_id(i)] = static_cast<int>(i);
    }
    return core::Result<CommunityAssignment>(std::move(assignment));
}

std::unique_ptr<CommunityDetector> MakeCommunityDetector(core::CommunityAlgorithm algorithm) {
    switch (algorithm) {
        case core::CommunityAlgorithm::SINGLETON:
            return std::make_unique<SingletonDetector>();
        case core::CommunityAlgorithm::LOUVAIN:
        default:
            return std::make_unique<LouvainDetector>();
    }
}

core::Result<double> Modularity(const graph::Graph& input, const CommunityAssignment& communities, double resolution) {
    using R = core::Result<double>;
    const graph::Graph graph = input.directed() ? input.to_undirected() : input;
    const size_t n = graph.node_count();

    IGraphIntVector membership(static_cast<igraph_integer_t>(n));
    std::map<int, igraph_integer_t> dense;
    for (size_t i = 0; i < n; ++i) {
        auto it = communities.find(graph.node_id(i));
        if (it == communities.end()) {
            return R::error(core::InvalidArgumentError("Node " + graph.node_id(i) + " has no community"));
        }
        membership[static_cast<igraph_integer_t>(i)] =
            dense.emplace(it->second, static_cast<igraph_integer_t>(dense.size())).first->second;
    }
    if (graph.edge_count() == 0) {
        return R(0.0);
    }

    IGraphHandle handle(graph);
    igraph_real_t modularity = 0.0;
    auto status = CheckIGraph(igraph_modularity(handle.get(), membership.get(), handle.weights(), resolution,
                                                false, &modularity),
                              "Modularity");
    if (!status.ok()) {
        return R::error_from(status);
    }
    return R(modularity);
}

} // namespace analytics
} // namespace scigraph
