#ifndef SCIGRAPH_GRAPH_GRAPH_H_
#define SCIGRAPH_GRAPH_GRAPH_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "scigraph/core/types.h"

namespace scigraph {
namespace graph {

/**
 * @brief Attributes carried by paper nodes of a citation graph
 */
struct NodeAttributes {
    int32_t year = 0;
    int64_t citations = 0;
    int64_t patents = 0;

    bool operator==(const NodeAttributes& other) const {
        return year == other.year && citations == other.citations && patents == other.patents;
    }
};

/**
 * @brief Weighted simple graph over string node ids
 *
 * Nodes are indexed densely in insertion order. Self-loops are rejected and
 * adding an existing edge again adds to its weight. In an undirected graph
 * every edge is stored in both adjacency lists.
 */
class Graph {
public:
    using Adjacency = std::map<size_t, int64_t>;

    Graph() : Graph(false) {}
    explicit Graph(bool directed);

    bool directed() const { return directed_; }

    // Returns the index of the node, inserting it when new
    size_t add_node(const std::string& id);
    size_t add_node(const std::string& id, const NodeAttributes& attributes);

    // Returns false for self-loops and non-positive weights
    bool add_edge(const std::string& source, const std::string& target, int64_t weight = 1);

    size_t node_count() const { return ids_.size(); }
    size_t edge_count() const { return edge_count_; }
    bool empty() const { return ids_.empty(); }

    bool has_node(const std::string& id) const { return index_.count(id) > 0; }
    std::optional<size_t> index_of(const std::string& id) const;
    const std::string& node_id(size_t index) const { return ids_.at(index); }
    const std::vector<std::string>& nodes() const { return ids_; }
    const std::optional<NodeAttributes>& attributes(size_t index) const { return attributes_.at(index); }

    bool has_edge(const std::string& source, const std::string& target) const;
    std::optional<int64_t> edge_weight(const std::string& source, const std::string& target) const;

    // Successors (directed) or neighbors (undirected)
    const Adjacency& out_neighbors(size_t index) const { return out_.at(index); }
    // Predecessors (directed) or neighbors (undirected)
    const Adjacency& in_neighbors(size_t index) const { return directed_ ? in_.at(index) : out_.at(index); }

    // In + out edge count for directed graphs
    size_t degree(size_t index) const;

    /**
     * @brief Edge list sorted by (source, target)
     *
     * Undirected edges are reported once with source < target.
     */
    std::vector<core::EdgeRecord> edges() const;

    // Undirected copy; reciprocal directed edges merge by summing weights
    Graph to_undirected() const;

private:
    bool directed_;
    std::vector<std::string> ids_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::optional<NodeAttributes>> attributes_;
    std::vector<Adjacency> out_;
    std::vector<Adjacency> in_;
    size_t edge_count_ = 0;
};

} // namespace graph
} // namespace scigraph

#endif // SCIGRAPH_GRAPH_GRAPH_H_
