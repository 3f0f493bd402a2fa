#include "scigraph/graph/graph_builder.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <string>

#include "scigraph/common/logger.h"
#include "scigraph/query/select_builder.h"

namespace scigraph {
namespace graph {

using query::Predicate;
using query::SelectBuilder;
using storage::ArtifactKind;
using storage::CacheKey;
using storage::ReadParquet;

namespace {

constexpr const char* kGraphPapersTable = "graph_paper_ids";

Predicate ColumnsEqual(const std::string& lhs, const std::string& rhs) {
    return Predicate::CompareColumns(lhs, Predicate::Op::EQ, rhs);
}

core::Result<std::vector<core::EdgeRecord>> ReadEdges(const storage::RowSet& rows,
                                                      const std::string& source_column,
                                                      const std::string& target_column) {
    using R = core::Result<std::vector<core::EdgeRecord>>;
    auto source = rows.column_index(source_column);
    auto target = rows.column_index(target_column);
    auto weight = rows.column_index("weight");
    if (!source || !target || !weight) {
        return R::error(core::SchemaError("Edge query must return " + source_column + ", " +
                                          target_column + " and weight"));
    }

    std::vector<core::EdgeRecord> edges;
    edges.reserve(rows.row_count());
    for (size_t r = 0; r < rows.row_count(); ++r) {
        auto u = rows.get_string(r, *source);
        auto v = rows.get_string(r, *target);
        if (!u || !v) {
            continue;
        }
        edges.emplace_back(*u, *v, rows.get_int(r, *weight).value_or(1));
    }
    return R(std::move(edges));
}

} // namespace

GraphBuilder::GraphBuilder(std::shared_ptr<storage::ColumnarStore> store,
                           core::CorpusPaths paths,
                           std::string institution_id,
                           storage::DiskCache& cache,
                           core::GraphConfig config)
    : store_(std::move(store)),
      paths_(std::move(paths)),
      institution_id_(std::move(institution_id)),
      cache_(cache),
      config_(config) {
    if (!store_) {
        throw core::InvalidArgumentError("GraphBuilder requires a store");
    }
}

std::optional<CacheKey> GraphBuilder::cache_key(ArtifactKind kind, const core::PaperTable& papers) const {
    if (!papers.provenance) {
        return std::nullopt;
    }
    std::string signature = papers.provenance->signature;
    if (kind == ArtifactKind::COAUTHOR_PAIRS) {
        // Pairs depend on the guard as well as on the paper set
        signature += "_max" + std::to_string(config_.max_coauthors_per_paper);
    }
    return CacheKey(kind, papers.provenance->lookback_years, signature);
}

std::optional<std::vector<core::EdgeRecord>> GraphBuilder::load_cached_edges(const CacheKey& key,
                                                                             const Graph& graph) const {
    auto lookup = cache_.load_edges(key);
    if (lookup.status == storage::CacheLookup<std::vector<core::EdgeRecord>>::Status::MISS) {
        return std::nullopt;
    }
    const std::string path = cache_.path_for(key);
    if (lookup.corrupt()) {
        SCIGRAPH_WARN("Discarding unreadable edge cache {}: {}", path, lookup.detail);
        return std::nullopt;
    }

    const bool canonical = !graph.directed();
    for (const auto& edge : lookup.value) {
        const bool valid = edge.source != edge.target && edge.weight > 0 &&
                           graph.has_node(edge.source) && graph.has_node(edge.target) &&
                           (!canonical || edge.source < edge.target);
        if (!valid) {
            SCIGRAPH_WARN("Discarding edge cache {}: edge {} -> {} does not fit the node set",
                          path, edge.source, edge.target);
            return std::nullopt;
        }
    }
    SCIGRAPH_DEBUG("Loaded {} cached edges from {}", lookup.value.size(), path);
    return std::move(lookup.value);
}

void GraphBuilder::persist_edges(const CacheKey& key, const std::vector<core::EdgeRecord>& edges) const {
    auto stored = cache_.store_edges(key, edges);
    if (!stored.ok()) {
        SCIGRAPH_WARN("Edge list not persisted to {}: {}", cache_.path_for(key), stored.error());
    }
}

core::Result<void> GraphBuilder::register_papers(const core::PaperTable& papers) {
    std::vector<std::string> ids;
    ids.reserve(papers.size());
    for (const auto& paper : papers.papers) {
        ids.push_back(paper.paper_id);
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return store_->register_strings(kGraphPapersTable, "paperid", ids);
}

core::Result<Graph> GraphBuilder::build_citation_graph(const core::PaperTable& papers) {
    std::lock_guard<std::mutex> lock(mutex_);
    Graph graph(true);
    if (papers.empty()) {
        return core::Result<Graph>(std::move(graph));
    }

    for (const auto& paper : papers.papers) {
        NodeAttributes attributes;
        attributes.year = paper.year;
        attributes.citations = paper.cited_by_count;
        attributes.patents = paper.patent_count;
        graph.add_node(paper.paper_id, attributes);
    }

    auto key = cache_key(ArtifactKind::CITATION_EDGES, papers);
    if (key) {
        if (auto cached = load_cached_edges(*key, graph)) {
            for (const auto& edge : *cached) {
                graph.add_edge(edge.source, edge.target, edge.weight);
            }
            return core::Result<Graph>(std::move(graph));
        }
    }

    auto registered = register_papers(papers);
    if (!registered.ok()) {
        return core::Result<Graph>::error_from(registered);
    }

    SelectBuilder citing_refs;
    citing_refs.select({"refs.citing_paperid", "refs.cited_paperid"})
        .from(ReadParquet(paths_.paper_refs()), "refs")
        .inner_join(kGraphPapersTable, "fp1", ColumnsEqual("refs.citing_paperid", "fp1.paperid"));

    SelectBuilder citations;
    citations.with("citing_refs", citing_refs.build())
        .select({"citing_refs.citing_paperid", "citing_refs.cited_paperid", "COUNT(*) AS weight"})
        .from("citing_refs")
        .inner_join(kGraphPapersTable, "fp2", ColumnsEqual("citing_refs.cited_paperid", "fp2.paperid"))
        .where(Predicate::CompareColumns("citing_refs.citing_paperid", Predicate::Op::NE,
                                         "citing_refs.cited_paperid"))
        .group_by({"citing_refs.citing_paperid", "citing_refs.cited_paperid"})
        .order_by("citing_refs.citing_paperid")
        .order_by("citing_refs.cited_paperid");

    auto rows = store_->run(citations.build());
    if (!rows.ok()) {
        return core::Result<Graph>::error_from(rows);
    }
    auto edges = ReadEdges(rows.value(), "citing_paperid", "cited_paperid");
    if (!edges.ok()) {
        return core::Result<Graph>::error_from(edges);
    }

    for (const auto& edge : edges.value()) {
        graph.add_edge(edge.source, edge.target, edge.weight);
    }
    SCIGRAPH_INFO("Citation graph: {} nodes, {} edges", graph.node_count(), graph.edge_count());

    if (key) {
        persist_edges(*key, graph.edges());
    }
    return core::Result<Graph>(std::move(graph));
}

std::string GraphBuilder::institution_authors_query() const {
    SelectBuilder authors;
    authors.distinct()
        .select({"a.paperid", "a.authorid"})
        .from(ReadParquet(paths_.authorships()), "a")
        .inner_join(kGraphPapersTable, "fp", ColumnsEqual("a.paperid", "fp.paperid"))
        .where(Predicate::All({
            Predicate::Eq("a.institutionid", institution_id_),
            Predicate::IsNotNull("a.authorid"),
        }));
    return authors.build();
}

core::Result<Graph> GraphBuilder::build_collaboration_graph(const core::PaperTable& papers) {
    std::lock_guard<std::mutex> lock(mutex_);
    Graph graph(false);
    if (papers.empty()) {
        return core::Result<Graph>(std::move(graph));
    }

    auto registered = register_papers(papers);
    if (!registered.ok()) {
        return core::Result<Graph>::error_from(registered);
    }

    // Node set: every qualifying author, including those on guarded papers
    SelectBuilder author_list;
    author_list.with("institution_authors", institution_authors_query())
        .select({"paperid", "authorid"})
        .from("institution_authors")
        .order_by("authorid")
        .order_by("paperid");
    auto author_rows = store_->run(author_list.build());
    if (!author_rows.ok()) {
        return core::Result<Graph>::error_from(author_rows);
    }
    const storage::RowSet& rows = author_rows.value();
    if (!rows.has_column("paperid") || !rows.has_column("authorid")) {
        return core::Result<Graph>::error(core::SchemaError("Authorship table lacks paperid/authorid"));
    }
    for (const auto& author : rows.string_column("authorid")) {
        graph.add_node(author);
    }

    std::map<std::string, size_t> authors_per_paper;
    for (const auto& paper_id : rows.string_column("paperid")) {
        ++authors_per_paper[paper_id];
    }
    const size_t guarded = static_cast<size_t>(std::count_if(
        authors_per_paper.begin(), authors_per_paper.end(),
        [this](const auto& entry) { return entry.second > config_.max_coauthors_per_paper; }));
    if (guarded > 0) {
        SCIGRAPH_INFO("Excluding {} papers with more than {} institution authors from pair generation",
                      guarded, config_.max_coauthors_per_paper);
    }

    auto key = cache_key(ArtifactKind::COAUTHOR_PAIRS, papers);
    if (key) {
        if (auto cached = load_cached_edges(*key, graph)) {
            for (const auto& edge : *cached) {
                graph.add_edge(edge.source, edge.target, edge.weight);
            }
            return core::Result<Graph>(std::move(graph));
        }
    }

    SelectBuilder author_counts;
    author_counts.select({"paperid", "COUNT(*) AS author_count"})
        .from("institution_authors")
        .group_by({"paperid"});

    SelectBuilder limited;
    limited.select({"ia.paperid", "ia.authorid"})
        .from("institution_authors", "ia")
        .inner_join("paper_author_counts", "pac", ColumnsEqual("ia.paperid", "pac.paperid"))
        .where(Predicate::Le("pac.author_count", static_cast<int64_t>(config_.max_coauthors_per_paper)));

    // a1 < a2 in the join keeps every pair in canonical order
    SelectBuilder pairs;
    pairs.with("institution_authors", institution_authors_query())
        .with("paper_author_counts", author_counts.build())
        .with("limited_authors", limited.build())
        .select({"a1.authorid AS author1", "a2.authorid AS author2", "COUNT(*) AS weight"})
        .from("limited_authors", "a1")
        .inner_join("limited_authors", "a2", Predicate::All({
            ColumnsEqual("a1.paperid", "a2.paperid"),
            Predicate::CompareColumns("a1.authorid", Predicate::Op::LT, "a2.authorid"),
        }))
        .group_by({"a1.authorid", "a2.authorid"})
        .order_by("author1")
        .order_by("author2");

    auto pair_rows = store_->run(pairs.build());
    if (!pair_rows.ok()) {
        return core::Result<Graph>::error_from(pair_rows);
    }
    auto edges = ReadEdges(pair_rows.value(), "author1", "author2");
    if (!edges.ok()) {
        return core::Result<Graph>::error_from(edges);
    }
    for (const auto& edge : edges.value()) {
        graph.add_edge(edge.source, edge.target, edge.weight);
    }
    SCIGRAPH_INFO("Collaboration graph: {} authors, {} pairs", graph.node_count(), graph.edge_count());

    if (key) {
        persist_edges(*key, graph.edges());
    }
    return core::Result<Graph>(std::move(graph));
}

} // namespace graph
} // namespace scigraph
