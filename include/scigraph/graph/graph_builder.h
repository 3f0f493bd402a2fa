#ifndef SCIGRAPH_GRAPH_GRAPH_BUILDER_H_
#define SCIGRAPH_GRAPH_GRAPH_BUILDER_H_

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "scigraph/core/config.h"
#include "scigraph/core/result.h"
#include "scigraph/core/types.h"
#include "scigraph/graph/graph.h"
#include "scigraph/storage/columnar_store.h"
#include "scigraph/storage/disk_cache.h"

namespace scigraph {
namespace graph {

/**
 * @brief Derives citation and collaboration graphs from a filtered paper table
 *
 * Edge lists are cached under the paper table's provenance (window and
 * filter signature). Tables without provenance are never cached.
 *
 * Both builds share one registered id table in the store, so calls on the
 * same builder are serialized.
 */
class GraphBuilder {
public:
    GraphBuilder(std::shared_ptr<storage::ColumnarStore> store,
                 core::CorpusPaths paths,
                 std::string institution_id,
                 storage::DiskCache& cache,
                 core::GraphConfig config = core::GraphConfig::Default());

    /**
     * @brief Directed graph of references among the papers
     *
     * Nodes are the papers with their year, citation and patent counts.
     * Only references with both endpoints in the table are kept, self
     * citations are dropped and repeated pairs collapse into the weight.
     */
    core::Result<Graph> build_citation_graph(const core::PaperTable& papers);

    /**
     * @brief Undirected co-authorship graph of the institution's authors
     *
     * Nodes are all institution-affiliated authors of any paper in the table.
     * Edge weight counts shared papers; papers with more qualifying authors
     * than max_coauthors_per_paper contribute no pairs.
     */
    core::Result<Graph> build_collaboration_graph(const core::PaperTable& papers);

private:
    std::optional<storage::CacheKey> cache_key(storage::ArtifactKind kind,
                                               const core::PaperTable& papers) const;
    std::optional<std::vector<core::EdgeRecord>> load_cached_edges(const storage::CacheKey& key,
                                                                   const Graph& graph) const;
    void persist_edges(const storage::CacheKey& key, const std::vector<core::EdgeRecord>& edges) const;
    core::Result<void> register_papers(const core::PaperTable& papers);
    std::string institution_authors_query() const;

    std::shared_ptr<storage::ColumnarStore> store_;
    core::CorpusPaths paths_;
    std::string institution_id_;
    storage::DiskCache& cache_;
    core::GraphConfig config_;
    std::mutex mutex_;
};

} // namespace graph
} // namespace scigraph

#endif // SCIGRAPH_GRAPH_GRAPH_BUILDER_H_
