#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>

#include "scigraph/graph/graph_builder.h"
#include "scigraph/storage/counting_store.h"
#include "scigraph/storage/duckdb_store.h"
#include "test_util/corpus_fixture.h"
#include "test_util/temp_dir.h"

namespace scigraph {
namespace graph {
namespace {

using storage::ArtifactKind;
using storage::CacheKey;

constexpr const char* kSignature = "0123456789abcdef";
constexpr const char* kDefaultPairsSignature = "0123456789abcdef_max50";

class GraphBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("graph_builder_test");
        paths_ = core::CorpusPaths(dir_->str(), "t_");

        testutil::CorpusBuilder()
            .paper("W1", 2021, 7, 1).paper("W2", 2022, 3).paper("W3", 2023).paper("W4", 2023)
            .paper("W5", 2023).paper("W9", 2015)
            .cite("W1", "W2").cite("W1", "W2").cite("W2", "W3")
            .cite("W1", "W1").cite("W1", "W9").cite("W9", "W1")
            .author("W1", "A1", "I1").author("W1", "A2", "I1", "middle")
            .author("W1", "A3", "I1", "last").author("W1", "B1", "I2")
            .author("W2", "A1", "I1").author("W2", "A2", "I1", "last")
            .author("W3", "A3", "I1")
            .author("W4", "A1", "I1").author("W4", "A4", "I1", "last")
            .author("W5", "A5", "I1")
            .Write(paths_);

        core::StoreConfig config;
        config.memory_limit = "512MB";
        config.threads = 1;
        store_ = std::make_shared<storage::CountingStore>(std::make_shared<storage::DuckDBStore>(config));
        cache_ = std::make_unique<storage::DiskCache>(dir_->sub("cache"));
    }

    static core::PaperTable Papers(bool with_provenance = true) {
        core::PaperTable table;
        const std::vector<std::pair<std::string, int32_t>> rows = {
            {"W1", 2021}, {"W2", 2022}, {"W3", 2023}, {"W4", 2023}};
        for (const auto& row : rows) {
            core::Paper paper;
            paper.paper_id = row.first;
            paper.year = row.second;
            table.papers.push_back(paper);
        }
        table.papers[0].cited_by_count = 7;
        table.papers[0].patent_count = 1;
        if (with_provenance) {
            table.provenance = core::TableProvenance{5, kSignature};
        }
        return table;
    }

    GraphBuilder Builder(core::GraphConfig config = core::GraphConfig::Default()) {
        return GraphBuilder(store_, paths_, "I1", *cache_, config);
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    core::CorpusPaths paths_;
    std::shared_ptr<storage::CountingStore> store_;
    std::unique_ptr<storage::DiskCache> cache_;
};

TEST_F(GraphBuilderTest, CitationGraphKeepsInternalReferences) {
    auto built = Builder().build_citation_graph(Papers());
    ASSERT_TRUE(built.ok()) << built.error();
    const Graph& graph = built.value();

    EXPECT_TRUE(graph.directed());
    EXPECT_EQ(graph.node_count(), 4u);
    EXPECT_FALSE(graph.has_node("W9"));
    EXPECT_EQ(graph.edges(), (std::vector<core::EdgeRecord>{
                                 core::EdgeRecord("W1", "W2", 2),
                                 core::EdgeRecord("W2", "W3", 1),
                             }));

    const auto& attributes = graph.attributes(graph.index_of("W1").value());
    ASSERT_TRUE(attributes.has_value());
    EXPECT_EQ(attributes->year, 2021);
    EXPECT_EQ(attributes->citations, 7);
    EXPECT_EQ(attributes->patents, 1);
}

TEST_F(GraphBuilderTest, CitationEdgesAreCachedByProvenance) {
    ASSERT_TRUE(Builder().build_citation_graph(Papers()).ok());
    const CacheKey key(ArtifactKind::CITATION_EDGES, 5, kSignature);
    EXPECT_TRUE(cache_->exists(cache_->path_for(key)));

    store_->reset();
    auto cached = Builder().build_citation_graph(Papers());
    ASSERT_TRUE(cached.ok()) << cached.error();
    EXPECT_EQ(store_->query_count(), 0u);
    EXPECT_EQ(store_->registration_count(), 0u);
    EXPECT_EQ(cached.value().edge_count(), 2u);
    EXPECT_EQ(cached.value().edge_weight("W1", "W2").value(), 2);
}

TEST_F(GraphBuilderTest, TablesWithoutProvenanceAreNotCached) {
    ASSERT_TRUE(Builder().build_citation_graph(Papers(false)).ok());
    EXPECT_FALSE(cache_->exists(cache_->path_for(CacheKey(ArtifactKind::CITATION_EDGES, 5, kSignature))));
}

TEST_F(GraphBuilderTest, UnwritableCacheStillBuildsGraph) {
    const std::string blocked = dir_->sub("blocked");
    std::ofstream(blocked) << "not a directory";
    storage::DiskCache cache(blocked);
    GraphBuilder builder(store_, paths_, "I1", cache);

    auto built = builder.build_citation_graph(Papers());
    ASSERT_TRUE(built.ok()) << built.error();
    EXPECT_EQ(built.value().edge_count(), 2u);
    EXPECT_EQ(built.value().edge_weight("W1", "W2").value(), 2);
}

TEST_F(GraphBuilderTest, MismatchedEdgeCacheIsRebuilt) {
    const CacheKey key(ArtifactKind::CITATION_EDGES, 5, kSignature);
    ASSERT_TRUE(cache_->store_edges(key, {core::EdgeRecord("W1", "W99", 1)}).ok());

    auto built = Builder().build_citation_graph(Papers());
    ASSERT_TRUE(built.ok()) << built.error();
    EXPECT_GT(store_->query_count(), 0u);
    EXPECT_FALSE(built.value().has_node("W99"));
    EXPECT_EQ(built.value().edge_count(), 2u);

    auto rewritten = cache_->load_edges(key);
    ASSERT_TRUE(rewritten.hit());
    EXPECT_EQ(rewritten.value.size(), 2u);
}

TEST_F(GraphBuilderTest, CollaborationGraphCountsSharedPapers) {
    auto built = Builder().build_collaboration_graph(Papers());
    ASSERT_TRUE(built.ok()) << built.error();
    const Graph& graph = built.value();

    EXPECT_FALSE(graph.directed());
    EXPECT_EQ(graph.node_count(), 4u);
    EXPECT_FALSE(graph.has_node("B1"));
    EXPECT_FALSE(graph.has_node("A5"));
    EXPECT_EQ(graph.edges(), (std::vector<core::EdgeRecord>{
                                 core::EdgeRecord("A1", "A2", 2),
                                 core::EdgeRecord("A1", "A3", 1),
                                 core::EdgeRecord("A1", "A4", 1),
                                 core::EdgeRecord("A2", "A3", 1),
                             }));
}

TEST_F(GraphBuilderTest, LargeAuthorListsContributeNoPairs) {
    core::GraphConfig config;
    config.max_coauthors_per_paper = 2;
    auto built = Builder(config).build_collaboration_graph(Papers(false));
    ASSERT_TRUE(built.ok()) << built.error();
    const Graph& graph = built.value();

    // A3 only co-authored the guarded paper but is still a node
    EXPECT_TRUE(graph.has_node("A3"));
    EXPECT_EQ(graph.node_count(), 4u);
    EXPECT_EQ(graph.edges(), (std::vector<core::EdgeRecord>{
                                 core::EdgeRecord("A1", "A2", 1),
                                 core::EdgeRecord("A1", "A4", 1),
                             }));
}

TEST_F(GraphBuilderTest, CoauthorPairsAreCached) {
    ASSERT_TRUE(Builder().build_collaboration_graph(Papers()).ok());
    EXPECT_TRUE(cache_->exists(cache_->path_for(
        CacheKey(ArtifactKind::COAUTHOR_PAIRS, 5, kDefaultPairsSignature))));

    store_->reset();
    auto cached = Builder().build_collaboration_graph(Papers());
    ASSERT_TRUE(cached.ok()) << cached.error();
    // Only the author list is queried; pairs come from the cache
    EXPECT_EQ(store_->query_count(), 1u);
    EXPECT_EQ(cached.value().edge_count(), 4u);
}

TEST_F(GraphBuilderTest, CoauthorPairCacheDependsOnGuard) {
    ASSERT_TRUE(Builder().build_collaboration_graph(Papers()).ok());

    core::GraphConfig config;
    config.max_coauthors_per_paper = 2;
    auto guarded = Builder(config).build_collaboration_graph(Papers());
    ASSERT_TRUE(guarded.ok()) << guarded.error();
    EXPECT_EQ(guarded.value().edges(), (std::vector<core::EdgeRecord>{
                                           core::EdgeRecord("A1", "A2", 1),
                                           core::EdgeRecord("A1", "A4", 1),
                                       }));
    EXPECT_TRUE(cache_->exists(cache_->path_for(
        CacheKey(ArtifactKind::COAUTHOR_PAIRS, 5, std::string(kSignature) + "_max2"))));

    auto unguarded = Builder().build_collaboration_graph(Papers());
    ASSERT_TRUE(unguarded.ok()) << unguarded.error();
    EXPECT_EQ(unguarded.value().edge_count(), 4u);
}

TEST_F(GraphBuilderTest, ConcurrentBuildsShareOneBuilder) {
    GraphBuilder builder(store_, paths_, "I1", *cache_);
    core::PaperTable papers = Papers(false);

    std::vector<std::vector<core::EdgeRecord>> citations(4);
    std::vector<std::vector<core::EdgeRecord>> pairs(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < citations.size(); ++i) {
        threads.emplace_back([&, i]() {
            auto citation = builder.build_citation_graph(papers);
            if (citation.ok()) {
                citations[i] = citation.value().edges();
            }
            auto collaboration = builder.build_collaboration_graph(papers);
            if (collaboration.ok()) {
                pairs[i] = collaboration.value().edges();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (size_t i = 0; i < citations.size(); ++i) {
        EXPECT_EQ(citations[i].size(), 2u) << "thread " << i;
        EXPECT_EQ(pairs[i].size(), 4u) << "thread " << i;
    }
}

TEST_F(GraphBuilderTest, EmptyTableYieldsEmptyGraphs) {
    core::PaperTable empty;
    auto citation = Builder().build_citation_graph(empty);
    auto collaboration = Builder().build_collaboration_graph(empty);
    ASSERT_TRUE(citation.ok());
    ASSERT_TRUE(collaboration.ok());
    EXPECT_TRUE(citation.value().empty());
    EXPECT_TRUE(collaboration.value().empty());
    EXPECT_EQ(store_->query_count(), 0u);
}

TEST_F(GraphBuilderTest, MissingReferenceTableIsStoreUnavailable) {
    std::filesystem::remove(paths_.paper_refs());
    auto built = Builder().build_citation_graph(Papers());
    ASSERT_FALSE(built.ok());
    EXPECT_EQ(built.code(), core::Error::Code::STORE_UNAVAILABLE);
}

} // namespace
} // namespace graph
} // namespace scigraph
