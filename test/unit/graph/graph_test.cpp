#include <gtest/gtest.h>

#include "scigraph/graph/graph.h"

namespace scigraph {
namespace graph {
namespace {

TEST(GraphTest, NodesAreIndexedInInsertionOrder) {
    Graph graph(true);
    EXPECT_EQ(graph.add_node("W2"), 0u);
    EXPECT_EQ(graph.add_node("W1"), 1u);
    EXPECT_EQ(graph.add_node("W2"), 0u);
    EXPECT_EQ(graph.node_count(), 2u);
    EXPECT_EQ(graph.node_id(1), "W1");
    EXPECT_EQ(graph.index_of("W1").value(), 1u);
    EXPECT_FALSE(graph.index_of("W9").has_value());
}

TEST(GraphTest, AttributesAreOptional) {
    Graph graph(true);
    NodeAttributes attributes;
    attributes.year = 2021;
    attributes.citations = 4;
    graph.add_node("W1", attributes);
    graph.add_node("W2");

    ASSERT_TRUE(graph.attributes(0).has_value());
    EXPECT_EQ(*graph.attributes(0), attributes);
    EXPECT_FALSE(graph.attributes(1).has_value());
}

TEST(GraphTest, SelfLoopsAndNonPositiveWeightsAreRejected) {
    Graph graph(false);
    EXPECT_FALSE(graph.add_edge("A", "A"));
    EXPECT_FALSE(graph.add_edge("A", "B", 0));
    EXPECT_FALSE(graph.add_edge("A", "B", -2));
    EXPECT_EQ(graph.edge_count(), 0u);
}

TEST(GraphTest, RepeatedEdgesAccumulateWeight) {
    Graph graph(true);
    EXPECT_TRUE(graph.add_edge("W1", "W2", 2));
    EXPECT_TRUE(graph.add_edge("W1", "W2", 3));
    EXPECT_EQ(graph.edge_count(), 1u);
    EXPECT_EQ(graph.edge_weight("W1", "W2").value(), 5);
    EXPECT_EQ(graph.in_neighbors(graph.index_of("W2").value()).at(0), 5);
}

TEST(GraphTest, DirectedEdgesHaveOrientation) {
    Graph graph(true);
    graph.add_edge("W1", "W2");
    EXPECT_TRUE(graph.has_edge("W1", "W2"));
    EXPECT_FALSE(graph.has_edge("W2", "W1"));
    EXPECT_EQ(graph.degree(0), 1u);
    EXPECT_EQ(graph.degree(1), 1u);
    EXPECT_TRUE(graph.out_neighbors(1).empty());
    EXPECT_EQ(graph.in_neighbors(1).size(), 1u);
}

TEST(GraphTest, UndirectedEdgesAreSymmetric) {
    Graph graph(false);
    graph.add_edge("B", "A", 2);
    graph.add_edge("A", "B", 1);
    EXPECT_EQ(graph.edge_count(), 1u);
    EXPECT_EQ(graph.edge_weight("A", "B").value(), 3);
    EXPECT_EQ(graph.edge_weight("B", "A").value(), 3);

    auto edges = graph.edges();
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0], core::EdgeRecord("A", "B", 3));
}

TEST(GraphTest, EdgeListIsSorted) {
    Graph graph(true);
    graph.add_edge("W3", "W1");
    graph.add_edge("W1", "W3");
    graph.add_edge("W1", "W2");
    auto edges = graph.edges();
    ASSERT_EQ(edges.size(), 3u);
    EXPECT_EQ(edges[0], core::EdgeRecord("W1", "W2", 1));
    EXPECT_EQ(edges[1], core::EdgeRecord("W1", "W3", 1));
    EXPECT_EQ(edges[2], core::EdgeRecord("W3", "W1", 1));
}

TEST(GraphTest, ToUndirectedMergesReciprocalEdges) {
    Graph graph(true);
    NodeAttributes attributes;
    attributes.year = 2020;
    graph.add_node("W1", attributes);
    graph.add_edge("W1", "W2", 2);
    graph.add_edge("W2", "W1", 1);
    graph.add_edge("W2", "W3");
    graph.add_node("W4");

    Graph undirected = graph.to_undirected();
    EXPECT_FALSE(undirected.directed());
    EXPECT_EQ(undirected.node_count(), 4u);
    EXPECT_EQ(undirected.edge_count(), 2u);
    EXPECT_EQ(undirected.edge_weight("W2", "W1").value(), 3);
    EXPECT_EQ(undirected.degree(undirected.index_of("W4").value()), 0u);
    EXPECT_TRUE(undirected.attributes(0).has_value());
}

} // namespace
} // namespace graph
} // namespace scigraph
