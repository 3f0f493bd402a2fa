#ifndef SCIGRAPH_GRAPH_GRAPH_JSON_H_
#define SCIGRAPH_GRAPH_GRAPH_JSON_H_

#include <string>

#include "scigraph/core/result.h"
#include "scigraph/graph/graph.h"

namespace scigraph {
namespace graph {

/**
 * @brief Node-link JSON form of a graph
 *
 * {"directed": bool,
 *  "nodes": [{"id": str, "year": int, "citations": int, "patents": int}, ...],
 *  "edges": [{"source": str, "target": str, "weight": int}, ...]}
 *
 * Attribute keys are present only on nodes that carry attributes.
 */
std::string GraphToJson(const Graph& graph);

core::Result<Graph> GraphFromJson(const std::string& json);

} // namespace graph
} // namespace scigraph

#endif // SCIGRAPH_GRAPH_GRAPH_JSON_H_
