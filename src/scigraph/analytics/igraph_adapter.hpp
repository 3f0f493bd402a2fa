#pragma once

#include <igraph/igraph.h>
#include <string>
#include <vector>
#include "scigraph/core/result.h"
#include "scigraph/graph/graph.h"

namespace scigraph {
namespace analytics {

// Routes igraph failures through return codes instead of abort(); safe to call repeatedly
void InitIGraph();

core::Result<void> CheckIGraph(igraph_error_t status, const std::string& what);

/**
 * @brief Owning wrapper around igraph_vector_t
 */
class IGraphVector {
public:
    explicit IGraphVector(igraph_integer_t size = 0);
    ~IGraphVector();

    IGraphVector(const IGraphVector&) = delete;
    IGraphVector& operator=(const IGraphVector&) = delete;

    igraph_vector_t* get() { return &vector_; }
    const igraph_vector_t* get() const { return &vector_; }

    igraph_integer_t size() const { return igraph_vector_size(&vector_); }
    igraph_real_t& operator[](igraph_integer_t i) { return VECTOR(vector_)[i]; }
    igraph_real_t operator[](igraph_integer_t i) const { return VECTOR(vector_)[i]; }

    std::vector<double> values() const;

private:
    igraph_vector_t vector_;
};

/**
 * @brief Owning wrapper around igraph_vector_int_t
 */
class IGraphIntVector {
public:
    explicit IGraphIntVector(igraph_integer_t size = 0);
    ~IGraphIntVector();

    IGraphIntVector(const IGraphIntVector&) = delete;
    IGraphIntVector& operator=(const IGraphIntVector&) = delete;

    igraph_vector_int_t* get() { return &vector_; }
    const igraph_vector_int_t* get() const { return &vector_; }

    igraph_integer_t size() const { return igraph_vector_int_size(&vector_); }
    igraph_integer_t& operator[](igraph_integer_t i) { return VECTOR(vector_)[i]; }
    igraph_integer_t operator[](igraph_integer_t i) const { return VECTOR(vector_)[i]; }

private:
    igraph_vector_int_t vector_;
};

/**
 * @brief igraph copy of a Graph with its edge weights
 *
 * Vertex ids equal Graph node indices. An undirected Graph contributes
 * every edge once.
 */
class IGraphHandle {
public:
    explicit IGraphHandle(const graph::Graph& graph);
    ~IGraphHandle();

    IGraphHandle(const IGraphHandle&) = delete;
    IGraphHandle& operator=(const IGraphHandle&) = delete;

    const igraph_t* get() const { return &graph_; }
    const igraph_vector_t* weights() const { return weights_.get(); }
    igraph_integer_t edge_count() const { return igraph_ecount(&graph_); }

private:
    igraph_t graph_;
    IGraphVector weights_;
};

} // namespace analytics
} // namespace scigraph
