#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "scigraph/analytics/community.h"
#include "scigraph/core/error.h"

namespace scigraph {
namespace analytics {
namespace {

using graph::Graph;

void AddClique(Graph& graph, const std::vector<std::string>& members) {
    for (size_t i = 0; i < members.size(); ++i) {
        for (size_t j = i + 1; j < members.size(); ++j) {
            graph.add_edge(members[i], members[j]);
        }
    }
}

// Two 4-cliques joined by a single bridge A1-B1
Graph TwoCliques(bool directed = false) {
    Graph graph(directed);
    AddClique(graph, {"A1", "A2", "A3", "A4"});
    AddClique(graph, {"B1", "B2", "B3", "B4"});
    graph.add_edge("A1", "B1");
    return graph;
}

std::set<int> CommunityIds(const CommunityAssignment& assignment) {
    std::set<int> ids;
    for (const auto& entry : assignment) {
        ids.insert(entry.second);
    }
    return ids;
}

TEST(CommunityTest, LouvainSeparatesCliques) {
    Graph graph = TwoCliques();
    LouvainDetector detector;
    auto detected = detector.detect(graph);
    ASSERT_TRUE(detected.ok()) << detected.error();
    const CommunityAssignment& assignment = detected.value();

    ASSERT_EQ(assignment.size(), 8u);
    for (const std::string& id : {"A2", "A3", "A4"}) {
        EXPECT_EQ(assignment.at(id), assignment.at("A1")) << id;
    }
    for (const std::string& id : {"B2", "B3", "B4"}) {
        EXPECT_EQ(assignment.at(id), assignment.at("B1")) << id;
    }
    EXPECT_NE(assignment.at("A1"), assignment.at("B1"));
    EXPECT_EQ(CommunityIds(assignment), (std::set<int>{0, 1}));
    // Ids follow node order, so the first clique is community 0
    EXPECT_EQ(assignment.at("A1"), 0);

    auto modularity = Modularity(graph, assignment);
    ASSERT_TRUE(modularity.ok()) << modularity.error();
    EXPECT_GT(modularity.value(), 0.3);
}

TEST(CommunityTest, LouvainIsRepeatableForASeed) {
    Graph graph = TwoCliques();
    auto first = LouvainDetector(1.0, 5).detect(graph);
    auto second = LouvainDetector(1.0, 5).detect(graph);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value(), second.value());
}

TEST(CommunityTest, LouvainTreatsDirectedInputAsUndirected) {
    auto directed = LouvainDetector().detect(TwoCliques(true));
    auto undirected = LouvainDetector().detect(TwoCliques(false));
    ASSERT_TRUE(directed.ok()) << directed.error();
    ASSERT_TRUE(undirected.ok()) << undirected.error();
    EXPECT_EQ(directed.value(), undirected.value());
}

TEST(CommunityTest, EdgelessGraphGivesSingletons) {
    Graph graph(false);
    graph.add_node("X");
    graph.add_node("Y");
    graph.add_node("Z");
    auto assignment = LouvainDetector().detect(graph);
    ASSERT_TRUE(assignment.ok()) << assignment.error();
    EXPECT_EQ(CommunityIds(assignment.value()), (std::set<int>{0, 1, 2}));

    auto modularity = Modularity(graph, assignment.value());
    ASSERT_TRUE(modularity.ok());
    EXPECT_DOUBLE_EQ(modularity.value(), 0.0);
}

TEST(CommunityTest, EmptyGraphGivesEmptyAssignment) {
    auto assignment = LouvainDetector().detect(Graph(false));
    ASSERT_TRUE(assignment.ok());
    EXPECT_TRUE(assignment.value().empty());
}

TEST(CommunityTest, SingletonDetectorGivesEachNodeItsOwnCommunity) {
    Graph graph = TwoCliques();
    SingletonDetector detector;
    auto detected = detector.detect(graph);
    ASSERT_TRUE(detected.ok());
    const CommunityAssignment& assignment = detected.value();
    ASSERT_EQ(assignment.size(), 8u);
    for (size_t i = 0; i < graph.node_count(); ++i) {
        EXPECT_EQ(assignment.at(graph.node_id(i)), static_cast<int>(i));
    }
    EXPECT_FALSE(detector.is_meaningful());

    auto modularity = Modularity(graph, assignment);
    ASSERT_TRUE(modularity.ok());
    EXPECT_LT(modularity.value(), 0.0);
}

TEST(CommunityTest, FactorySelectsAlgorithm) {
    auto louvain = MakeCommunityDetector(core::CommunityAlgorithm::LOUVAIN);
    EXPECT_EQ(louvain->algorithm(), core::CommunityAlgorithm::LOUVAIN);
    EXPECT_TRUE(louvain->is_meaningful());

    auto singleton = MakeCommunityDetector(core::CommunityAlgorithm::SINGLETON);
    EXPECT_EQ(singleton->algorithm(), core::CommunityAlgorithm::SINGLETON);
}

TEST(CommunityTest, ModularityOfSingleCommunityIsZero) {
    Graph graph = TwoCliques();
    CommunityAssignment all;
    for (const auto& id : graph.nodes()) {
        all[id] = 7;
    }
    auto modularity = Modularity(graph, all);
    ASSERT_TRUE(modularity.ok());
    EXPECT_NEAR(modularity.value(), 0.0, 1e-12);
}

TEST(CommunityTest, ModularityRejectsMissingNode) {
    Graph graph = TwoCliques();
    CommunityAssignment partial{{"A1", 0}};
    auto modularity = Modularity(graph, partial);
    ASSERT_FALSE(modularity.ok());
    EXPECT_EQ(modularity.code(), core::Error::Code::INVALID_ARGUMENT);
}

} // namespace
} // namespace analytics
} // namespace scigraph
