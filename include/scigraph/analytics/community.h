#ifndef SCIGRAPH_ANALYTICS_COMMUNITY_H_
#define SCIGRAPH_ANALYTICS_COMMUNITY_H_

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "scigraph/core/config.h"
#include "scigraph/core/result.h"
#include "scigraph/graph/graph.h"

namespace scigraph {
namespace analytics {

// Node id -> dense community id starting at 0
using CommunityAssignment = std::map<std::string, int>;

/**
 * @brief Strategy interface for community detection
 *
 * Detectors always run on the undirected projection of the input graph.
 */
class CommunityDetector {
public:
    virtual ~CommunityDetector() = default;

    virtual core::Result<CommunityAssignment> detect(const graph::Graph& graph) const = 0;

    virtual core::CommunityAlgorithm algorithm() const = 0;

    // False when the assignment carries no structure (one community per node)
    virtual bool is_meaningful() const = 0;
};

/**
 * @brief Multi-level modularity optimization (Blondel et al. 2008) via igraph
 *
 * igraph shuffles the visiting order; seeding its generator makes the
 * result deterministic for a given graph and seed. Community ids are
 * renumbered by first appearance in node index order.
 */
class LouvainDetector : public CommunityDetector {
public:
    explicit LouvainDetector(double resolution = 1.0, uint64_t seed = 42);

    core::Result<CommunityAssignment> detect(const graph::Graph& graph) const override;
    core::CommunityAlgorithm algorithm() const override { return core::CommunityAlgorithm::LOUVAIN; }
    bool is_meaningful() const override { return true; }

private:
    double resolution_;
    uint64_t seed_;
};

/**
 * @brief Places every node in its own community
 */
class SingletonDetector : public CommunityDetector {
public:
    core::Result<CommunityAssignment> detect(const graph::Graph& graph) const override;
    core::CommunityAlgorithm algorithm() const override { return core::CommunityAlgorithm::SINGLETON; }
    bool is_meaningful() const override { return false; }
};

std::unique_ptr<CommunityDetector> MakeCommunityDetector(core::CommunityAlgorithm algorithm);

// Weighted modularity of an assignment on the undirected projection; 0 without edges.
// INVALID_ARGUMENT when a node has no community.
core::Result<double> Modularity(const graph::Graph& graph, const CommunityAssignment& communities,
                                double resolution = 1.0);

} // namespace analytics
} // namespace scigraph

#endif // SCIGRAPH_ANALYTICS_COMMUNITY_H_
