#include "scigraph/graph/graph.h"

#include <algorithm>

namespace scigraph {
namespace graph {

Graph::Graph(bool directed) : directed_(directed) {}

size_t Graph::add_node(const std::string& id) {
    auto it = index_.find(id);
    if (it != index_.end()) {
        return it->second;
    }
    const size_t index = ids_.size();
    ids_.push_back(id);
    index_.emplace(id, index);
    attributes_.emplace_back();
    out_.emplace_back();
    if (directed_) {
        in_.emplace_back();
    }
    return index;
}

size_t Graph::add_node(const std::string& id, const NodeAttributes& attributes) {
    const size_t index = add_node(id);
    attributes_[index] = attributes;
    return index;
}

bool Graph::add_edge(const std::string& source, const std::string& target, int64_t weight) {
    if (source == target || weight <= 0) {
        return false;
    }
    const size_t u = add_node(source);
    const size_t v = add_node(target);

    auto& forward = out_[u];
    auto existing = forward.find(v);
    if (existing != forward.end()) {
        existing->second += weight;
        if (directed_) {
            in_[v][u] += weight;
        } else {
            out_[v][u] += weight;
        }
        return true;
    }

    forward.emplace(v, weight);
    if (directed_) {
        in_[v].emplace(u, weight);
    } else {
        out_[v].emplace(u, weight);
    }
    ++edge_count_;
    return true;
}

std::optional<size_t> Graph::index_of(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Graph::has_edge(const std::string& source, const std::string& target) const {
    return edge_weight(source, target).has_value();
}

std::optional<int64_t> Graph::edge_weight(const std::string& source, const std::string& target) const {
    auto u = index_of(source);
    auto v = index_of(target);
    if (!u || !v) {
        return std::nullopt;
    }
    const auto& adjacency = out_[*u];
    auto it = adjacency.find(*v);
    if (it == adjacency.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t Graph::degree(size_t index) const {
    if (directed_) {
        return out_.at(index).size() + in_.at(index).size();
    }
    return out_.at(index).size();
}

std::vector<core::EdgeRecord> Graph::edges() const {
    std::vector<core::EdgeRecord> result;
    result.reserve(edge_count_);
    for (size_t u = 0; u < ids_.size(); ++u) {
        for (const auto& [v, weight] : out_[u]) {
            if (directed_) {
                result.emplace_back(ids_[u], ids_[v], weight);
            } else if (ids_[u] < ids_[v]) {
                result.emplace_back(ids_[u], ids_[v], weight);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const core::EdgeRecord& a, const core::EdgeRecord& b) {
        return a.source != b.source ? a.source < b.source : a.target < b.target;
    });
    return result;
}

Graph Graph::to_undirected() const {
    Graph undirected(false);
    for (size_t i = 0; i < ids_.size(); ++i) {
        if (attributes_[i]) {
            undirected.add_node(ids_[i], *attributes_[i]);
        } else {
            undirected.add_node(ids_[i]);
        }
    }
    for (size_t u = 0; u < ids_.size(); ++u) {
        for (const auto& [v, weight] : out_[u]) {
            if (directed_ || u < v) {
                undirected.add_edge(ids_[u], ids_[v], weight);
            }
        }
    }
    return undirected;
}

} // namespace graph
} // namespace scigraph
