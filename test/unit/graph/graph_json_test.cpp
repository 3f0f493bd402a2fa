#include <gtest/gtest.h>

#include <rapidjson/document.h>

#include "scigraph/graph/graph_json.h"

namespace scigraph {
namespace graph {
namespace {

TEST(GraphJsonTest, NodeLinkLayout) {
    Graph graph(true);
    NodeAttributes attributes;
    attributes.year = 2022;
    attributes.citations = 8;
    attributes.patents = 1;
    graph.add_node("W1", attributes);
    graph.add_node("W2");
    graph.add_edge("W1", "W2", 3);

    rapidjson::Document doc;
    doc.Parse(GraphToJson(graph).c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_TRUE(doc["directed"].GetBool());

    const auto& nodes = doc["nodes"];
    ASSERT_EQ(nodes.Size(), 2u);
    EXPECT_STREQ(nodes[0]["id"].GetString(), "W1");
    EXPECT_EQ(nodes[0]["year"].GetInt(), 2022);
    EXPECT_EQ(nodes[0]["citations"].GetInt64(), 8);
    EXPECT_FALSE(nodes[1].HasMember("year"));

    const auto& edges = doc["edges"];
    ASSERT_EQ(edges.Size(), 1u);
    EXPECT_STREQ(edges[0]["source"].GetString(), "W1");
    EXPECT_STREQ(edges[0]["target"].GetString(), "W2");
    EXPECT_EQ(edges[0]["weight"].GetInt64(), 3);
}

TEST(GraphJsonTest, ParsedGraphMatchesOriginal) {
    Graph graph(false);
    graph.add_node("A3");
    graph.add_edge("A1", "A2", 4);
    graph.add_edge("A2", "A3", 1);

    auto parsed = GraphFromJson(GraphToJson(graph));
    ASSERT_TRUE(parsed.ok()) << parsed.error();
    const Graph& copy = parsed.value();
    EXPECT_FALSE(copy.directed());
    EXPECT_EQ(copy.nodes(), graph.nodes());
    EXPECT_EQ(copy.edges(), graph.edges());
}

TEST(GraphJsonTest, RejectsMalformedDocuments) {
    EXPECT_FALSE(GraphFromJson("[]").ok());
    EXPECT_FALSE(GraphFromJson(R"({"directed": true, "nodes": []})").ok());
    EXPECT_FALSE(GraphFromJson(R"({"directed": true, "nodes": [{"name": "x"}], "edges": []})").ok());

    auto self_loop = GraphFromJson(
        R"({"directed": true, "nodes": [{"id": "W1"}],
            "edges": [{"source": "W1", "target": "W1", "weight": 1}]})");
    ASSERT_FALSE(self_loop.ok());
    EXPECT_EQ(self_loop.code(), core::Error::Code::INVALID_ARGUMENT);
}

} // namespace
} // namespace graph
} // namespace scigraph
