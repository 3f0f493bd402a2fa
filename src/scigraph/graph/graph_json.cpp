#include "scigraph/graph/graph_json.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace scigraph {
namespace graph {

std::string GraphToJson(const Graph& graph) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("directed");
    writer.Bool(graph.directed());

    writer.Key("nodes");
    writer.StartArray();
    for (size_t i = 0; i < graph.node_count(); ++i) {
        writer.StartObject();
        writer.Key("id");
        writer.String(graph.node_id(i).c_str(), static_cast<rapidjson::SizeType>(graph.node_id(i).size()));
        const auto& attributes = graph.attributes(i);
        if (attributes) {
            writer.Key("year");
            writer.Int(attributes->year);
            writer.Key("citations");
            writer.Int64(attributes->citations);
            writer.Key("patents");
            writer.Int64(attributes->patents);
        }
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("edges");
    writer.StartArray();
    for (const auto& edge : graph.edges()) {
        writer.StartObject();
        writer.Key("source");
        writer.String(edge.source.c_str(), static_cast<rapidjson::SizeType>(edge.source.size()));
        writer.Key("target");
        writer.String(edge.target.c_str(), static_cast<rapidjson::SizeType>(edge.target.size()));
        writer.Key("weight");
        writer.Int64(edge.weight);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();
    return buffer.GetString();
}

core::Result<Graph> GraphFromJson(const std::string& json) {
    using R = core::Result<Graph>;

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return R::error("Graph JSON is not an object", core::Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.HasMember("directed") || !doc["directed"].IsBool() ||
        !doc.HasMember("nodes") || !doc["nodes"].IsArray() ||
        !doc.HasMember("edges") || !doc["edges"].IsArray()) {
        return R::error("Graph JSON requires directed, nodes and edges", core::Error::Code::INVALID_ARGUMENT);
    }

    Graph graph(doc["directed"].GetBool());
    for (const auto& node : doc["nodes"].GetArray()) {
        if (!node.IsObject() || !node.HasMember("id") || !node["id"].IsString()) {
            return R::error("Graph JSON node without string id", core::Error::Code::INVALID_ARGUMENT);
        }
        const std::string id = node["id"].GetString();
        if (node.HasMember("year") && node["year"].IsInt()) {
            NodeAttributes attributes;
            attributes.year = node["year"].GetInt();
            if (node.HasMember("citations") && node["citations"].IsInt64()) {
                attributes.citations = node["citations"].GetInt64();
            }
            if (node.HasMember("patents") && node["patents"].IsInt64()) {
                attributes.patents = node["patents"].GetInt64();
            }
            graph.add_node(id, attributes);
        } else {
            graph.add_node(id);
        }
    }

    for (const auto& edge : doc["edges"].GetArray()) {
        if (!edge.IsObject() || !edge.HasMember("source") || !edge["source"].IsString() ||
            !edge.HasMember("target") || !edge["target"].IsString() ||
            !edge.HasMember("weight") || !edge["weight"].IsInt64()) {
            return R::error("Graph JSON edge needs source, target and integer weight",
                            core::Error::Code::INVALID_ARGUMENT);
        }
        if (!graph.add_edge(edge["source"].GetString(), edge["target"].GetString(),
                            edge["weight"].GetInt64())) {
            return R::error("Graph JSON contains a self-loop or non-positive weight",
                            core::Error::Code::INVALID_ARGUMENT);
        }
    }
    return R(std::move(graph));
}

} // namespace graph
} // namespace scigraph
