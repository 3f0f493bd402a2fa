#include "scigraph/analytics/node_metrics.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

#include "scigraph/analytics/igraph_adapter.hpp"
#include "scigraph/common/logger.h"

namespace scigraph {
namespace analytics {

using graph::Graph;
using Scores = core::Result<std::vector<double>>;

namespace {

// Partial Fisher-Yates: the first k entries are a uniform sample without replacement
std::vector<size_t> SampleSources(size_t n, size_t k, uint64_t seed) {
    std::vector<size_t> sources(n);
    std::iota(sources.begin(), sources.end(), 0);
    std::mt19937_64 rng(seed);
    for (size_t i = 0; i < k; ++i) {
        std::uniform_int_distribution<size_t> pick(i, n - 1);
        std::swap(sources[i], sources[pick(rng)]);
    }
    sources.resize(k);
    return sources;
}

} // namespace

std::vector<double> DegreeCentrality(const Graph& graph) {
    const size_t n = graph.node_count();
    std::vector<double> centrality(n, 1.0);
    if (n <= 1) {
        return centrality;
    }
    const double scale = 1.0 / static_cast<double>(n - 1);
    for (size_t i = 0; i < n; ++i) {
        centrality[i] = static_cast<double>(graph.degree(i)) * scale;
    }
    return centrality;
}

Scores PageRank(const Graph& graph, double damping) {
    if (graph.empty()) {
        return Scores(std::vector<double>());
    }
    IGraphHandle handle(graph);
    IGraphVector scores;
    igraph_real_t eigenvalue = 0.0;
    auto status = CheckIGraph(igraph_pagerank(handle.get(), IGRAPH_PAGERANK_ALGO_PRPACK, scores.get(),
                                              &eigenvalue, igraph_vss_all(), graph.directed(), damping,
                                              handle.weights(), nullptr),
                              "PageRank");
    if (!status.ok()) {
        return Scores::error_from(status);
    }
    return Scores(scores.values());
}

Scores EigenvectorCentrality(const Graph& graph, int max_iterations, double tolerance) {
    if (graph.empty()) {
        return Scores(std::vector<double>());
    }
    IGraphHandle handle(graph);
    IGraphVector scores;
    igraph_real_t eigenvalue = 0.0;
    igraph_arpack_options_t options;
    igraph_arpack_options_init(&options);
    options.mxiter = max_iterations;
    options.tol = tolerance;
    auto status = CheckIGraph(igraph_eigenvector_centrality(handle.get(), scores.get(), &eigenvalue,
                                                            false, true, nullptr, &options),
                              "Eigenvector centrality");
    if (!status.ok()) {
        return Scores::error_from(status);
    }

    std::vector<double> values = scores.values();
    double norm = 0.0;
    for (double value : values) {
        norm += value * value;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (double& value : values) {
            value /= norm;
        }
    }
    return Scores(std::move(values));
}

Scores Betweenness(const Graph& graph, std::optional<size_t> sample_size, uint64_t seed) {
    const size_t n = graph.node_count();
    if (n == 0) {
        return Scores(std::vector<double>());
    }

    IGraphHandle handle(graph);
    IGraphVector scores;
    size_t k = n;
    igraph_error_t code;
    if (sample_size && *sample_size < n) {
        k = *sample_size;
        const std::vector<size_t> sampled = SampleSources(n, k, seed);
        IGraphIntVector sources(static_cast<igraph_integer_t>(k));
        for (size_t i = 0; i < k; ++i) {
            sources[static_cast<igraph_integer_t>(i)] = static_cast<igraph_integer_t>(sampled[i]);
        }
        code = igraph_betweenness_subset(handle.get(), scores.get(), igraph_vss_all(), graph.directed(),
                                         igraph_vss_vector(sources.get()), igraph_vss_all(), nullptr);
    } else {
        code = igraph_betweenness(handle.get(), scores.get(), igraph_vss_all(), graph.directed(), nullptr);
    }
    auto status = CheckIGraph(code, "Betweenness");
    if (!status.ok()) {
        return Scores::error_from(status);
    }

    std::vector<double> values = scores.values();
    if (n <= 2) {
        return Scores(std::move(values));
    }
    // igraph counts each unordered pair once in undirected graphs
    double scale = (graph.directed() ? 1.0 : 2.0) /
                   (static_cast<double>(n - 1) * static_cast<double>(n - 2));
    if (k < n) {
        scale *= static_cast<double>(n) / static_cast<double>(k);
    }
    for (double& value : values) {
        value *= scale;
    }
    return Scores(std::move(values));
}

Scores Clustering(const Graph& graph) {
    const size_t n = graph.node_count();
    if (n == 0 || graph.directed()) {
        return Scores(std::vector<double>(n, 0.0));
    }
    IGraphHandle handle(graph);
    IGraphVector scores;
    auto status = CheckIGraph(igraph_transitivity_local_undirected(handle.get(), scores.get(), igraph_vss_all(),
                                                                   IGRAPH_TRANSITIVITY_ZERO),
                              "Clustering");
    if (!status.ok()) {
        return Scores::error_from(status);
    }
    return Scores(scores.values());
}

core::Result<NodeMetricsMap> ComputeNodeMetrics(const Graph& graph, const core::MetricsConfig& config,
                                                MetricsReport* report) {
    using R = core::Result<NodeMetricsMap>;
    NodeMetricsMap metrics;
    MetricsReport local;
    const size_t n = graph.node_count();
    if (n == 0) {
        if (report) {
            *report = local;
        }
        return R(std::move(metrics));
    }

    const std::vector<double> degree_centrality = DegreeCentrality(graph);

    auto importance = graph.directed()
        ? PageRank(graph, config.damping)
        : EigenvectorCentrality(graph, config.max_iterations, config.tolerance);
    std::vector<double> importance_scores;
    if (importance.ok()) {
        importance_scores = importance.take_value();
    } else {
        SCIGRAPH_WARN("{} on {} nodes: {}; reporting zero importance",
                      graph.directed() ? "PageRank" : "Eigenvector centrality", n, importance.error());
        local.importance_converged = false;
        importance_scores.assign(n, 0.0);
    }

    std::optional<size_t> sample;
    if (n >= config.exact_betweenness_threshold) {
        sample = std::min(config.betweenness_sample_size, n);
        local.betweenness_sampled = true;
        local.betweenness_sources = *sample;
        SCIGRAPH_DEBUG("Estimating betweenness of {} nodes from {} sampled sources", n, *sample);
    } else {
        local.betweenness_sources = n;
    }
    auto betweenness = Betweenness(graph, sample, config.seed);
    if (!betweenness.ok()) {
        return R::error_from(betweenness);
    }
    auto clustering = Clustering(graph);
    if (!clustering.ok()) {
        return R::error_from(clustering);
    }

    for (size_t i = 0; i < n; ++i) {
        NodeMetrics& node = metrics[graph.node_id(i)];
        node.degree = graph.degree(i);
        node.degree_centrality = degree_centrality[i];
        node.importance = importance_scores[i];
        node.betweenness = betweenness.value()[i];
        node.clustering = clustering.value()[i];
    }

    if (report) {
        *report = local;
    }
    return R(std::move(metrics));
}

} // namespace analytics
} // namespace scigraph
