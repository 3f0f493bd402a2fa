#ifndef SCIGRAPH_ANALYTICS_NODE_METRICS_H_
#define SCIGRAPH_ANALYTICS_NODE_METRICS_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "scigraph/core/config.h"
#include "scigraph/core/result.h"
#include "scigraph/graph/graph.h"

namespace scigraph {
namespace analytics {

/**
 * @brief Structural metrics of one node
 */
struct NodeMetrics {
    size_t degree = 0;               // In + out for directed graphs
    double degree_centrality = 0.0;  // degree / (n - 1)
    double importance = 0.0;         // PageRank (directed) or eigenvector centrality (undirected)
    double betweenness = 0.0;
    double clustering = 0.0;         // Always 0 in directed graphs
};

using NodeMetricsMap = std::map<std::string, NodeMetrics>;

/**
 * @brief How the metrics of the last ComputeNodeMetrics call were obtained
 */
struct MetricsReport {
    bool importance_converged = true;
    bool betweenness_sampled = false;
    size_t betweenness_sources = 0;
};

/**
 * @brief Computes every metric for every node of the graph
 *
 * Betweenness is exact below config.exact_betweenness_threshold nodes and
 * estimated from min(betweenness_sample_size, n) seeded random sources
 * otherwise. Importance falls back to all zeros when it cannot be computed;
 * that is reported, never raised.
 */
core::Result<NodeMetricsMap> ComputeNodeMetrics(const graph::Graph& graph,
                                                const core::MetricsConfig& config = core::MetricsConfig::Default(),
                                                MetricsReport* report = nullptr);

// The functions below return one score per node index.

std::vector<double> DegreeCentrality(const graph::Graph& graph);

// Weighted PageRank (PRPACK) with uniform teleport; scores sum to 1
core::Result<std::vector<double>> PageRank(const graph::Graph& graph, double damping);

/**
 * @brief Unweighted eigenvector centrality of the undirected projection
 *
 * Solved with ARPACK limited to max_iterations restarts and the given
 * tolerance. Scores are L2-normalized; an edgeless graph is uniform.
 */
core::Result<std::vector<double>> EigenvectorCentrality(const graph::Graph& graph,
                                                        int max_iterations,
                                                        double tolerance);

/**
 * @brief Unweighted betweenness normalized by the number of ordered or unordered pairs
 *
 * With sample_size set, only that many distinct sources (drawn with the
 * seed) are expanded and the result is rescaled by n / k.
 */
core::Result<std::vector<double>> Betweenness(const graph::Graph& graph,
                                              std::optional<size_t> sample_size = std::nullopt,
                                              uint64_t seed = 42);

// Local clustering coefficient of an undirected graph; zeros for directed graphs
core::Result<std::vector<double>> Clustering(const graph::Graph& graph);

} // namespace analytics
} // namespace scigraph

#endif // SCIGRAPH_ANALYTICS_NODE_METRICS_H_
