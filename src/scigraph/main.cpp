#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "scigraph/analytics/community.h"
#include "scigraph/analytics/node_metrics.h"
#include "scigraph/common/logger.h"
#include "scigraph/core/config.h"
#include "scigraph/graph/graph_builder.h"
#include "scigraph/graph/graph_json.h"
#include "scigraph/pipeline/corpus_filter.h"
#include "scigraph/pipeline/sample_materializer.h"
#include "scigraph/query/json_codec.h"
#include "scigraph/query/query_executor.h"
#include "scigraph/storage/counting_store.h"
#include "scigraph/storage/disk_cache.h"
#include "scigraph/storage/duckdb_store.h"

namespace scigraph {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

struct CommandLine {
    std::string command;
    std::string graph_kind = "citation";
    std::string operation;
    std::string options_json;
    bool print_stats = false;
};

/**
 * Wires the store, cache, filter pipeline, graph builder and query layer
 * for one CLI invocation.
 */
class Engine {
public:
    explicit Engine(const core::EngineConfig& config)
        : config_(config),
          counting_(std::make_shared<storage::CountingStore>(
              std::make_shared<storage::DuckDBStore>(config.store))),
          cache_(config.cache_dir),
          filter_(counting_, config.corpus(), config.criteria, cache_, config.ResolveCurrentYear()),
          builder_(counting_, config.corpus(), config.criteria.institution_id, cache_, config.graph) {}

    int run(const CommandLine& cli) {
        if (cli.command == "filter") return filter();
        if (cli.command == "graph") return graph(cli.graph_kind);
        if (cli.command == "metrics") return metrics(cli.graph_kind);
        if (cli.command == "communities") return communities(cli.graph_kind);
        if (cli.command == "query") return query(cli.operation, cli.options_json);
        if (cli.command == "sample") return sample();
        std::cerr << "Unknown command: " << cli.command << std::endl;
        return 1;
    }

    std::string stats() const { return counting_->stats(); }

private:
    int fail(const std::string& what, const std::string& error) {
        SCIGRAPH_ERROR("{} failed: {}", what, error);
        return 1;
    }

    int filter() {
        const int years = config_.criteria.lookback_years;
        auto papers = filter_.filtered_papers(years);
        if (!papers.ok()) {
            return fail("Filtering", papers.error());
        }
        rapidjson::StringBuffer buffer;
        JsonWriter writer(buffer);
        writer.StartObject();
        writer.Key("lookback_years");
        writer.Int(years);
        writer.Key("current_year");
        writer.Int(filter_.current_year());
        writer.Key("signature");
        writer.String(filter_.signature().c_str());
        writer.Key("paper_count");
        writer.Uint64(papers.value()->size());
        writer.EndObject();
        std::cout << buffer.GetString() << std::endl;
        return 0;
    }

    core::Result<graph::Graph> build(const std::string& kind) {
        auto papers = filter_.filtered_papers(config_.criteria.lookback_years);
        if (!papers.ok()) {
            return core::Result<graph::Graph>::error_from(papers);
        }
        if (kind == "collaboration") {
            return builder_.build_collaboration_graph(*papers.value());
        }
        if (kind != "citation") {
            return core::Result<graph::Graph>::error(
                core::InvalidArgumentError("Unknown graph kind: " + kind));
        }
        return builder_.build_citation_graph(*papers.value());
    }

    int graph(const std::string& kind) {
        auto built = build(kind);
        if (!built.ok()) {
            return fail("Graph construction", built.error());
        }
        std::cout << graph::GraphToJson(built.value()) << std::endl;
        return 0;
    }

    int metrics(const std::string& kind) {
        auto built = build(kind);
        if (!built.ok()) {
            return fail("Graph construction", built.error());
        }
        analytics::MetricsReport report;
        auto computed = analytics::ComputeNodeMetrics(built.value(), config_.metrics, &report);
        if (!computed.ok()) {
            return fail("Metrics", computed.error());
        }
        const analytics::NodeMetricsMap& metrics = computed.value();

        rapidjson::StringBuffer buffer;
        JsonWriter writer(buffer);
        writer.StartObject();
        writer.Key("importance_converged");
        writer.Bool(report.importance_converged);
        writer.Key("betweenness_sampled");
        writer.Bool(report.betweenness_sampled);
        writer.Key("nodes");
        writer.StartObject();
        for (const auto& entry : metrics) {
            writer.Key(entry.first.c_str());
            writer.StartObject();
            writer.Key("degree");
            writer.Uint64(entry.second.degree);
            writer.Key("degree_centrality");
            writer.Double(entry.second.degree_centrality);
            writer.Key("importance");
            writer.Double(entry.second.importance);
            writer.Key("betweenness");
            writer.Double(entry.second.betweenness);
            writer.Key("clustering");
            writer.Double(entry.second.clustering);
            writer.EndObject();
        }
        writer.EndObject();
        writer.EndObject();
        std::cout << buffer.GetString() << std::endl;
        return 0;
    }

    int communities(const std::string& kind) {
        auto built = build(kind);
        if (!built.ok()) {
            return fail("Graph construction", built.error());
        }
        auto detector = analytics::MakeCommunityDetector(config_.community_algorithm);
        auto assignment = detector->detect(built.value());
        if (!assignment.ok() && detector->algorithm() != core::CommunityAlgorithm::SINGLETON) {
            SCIGRAPH_WARN("{} failed ({}); falling back to singleton communities",
                          core::ToString(detector->algorithm()), assignment.error());
            detector = analytics::MakeCommunityDetector(core::CommunityAlgorithm::SINGLETON);
            assignment = detector->detect(built.value());
        }
        if (!assignment.ok()) {
            return fail("Community detection", assignment.error());
        }
        auto modularity = analytics::Modularity(built.value(), assignment.value());
        if (!modularity.ok()) {
            return fail("Modularity", modularity.error());
        }

        rapidjson::StringBuffer buffer;
        JsonWriter writer(buffer);
        writer.StartObject();
        writer.Key("algorithm");
        writer.String(core::ToString(detector->algorithm()));
        writer.Key("meaningful");
        writer.Bool(detector->is_meaningful());
        writer.Key("modularity");
        writer.Double(modularity.value());
        writer.Key("communities");
        writer.StartObject();
        for (const auto& entry : assignment.value()) {
            writer.Key(entry.first.c_str());
            writer.Int(entry.second);
        }
        writer.EndObject();
        writer.EndObject();
        std::cout << buffer.GetString() << std::endl;
        return 0;
    }

    int query(const std::string& operation, const std::string& options_json) {
        query::QueryExecutor executor(counting_, config_.sample(), config_.ResolveCurrentYear());
        auto result = executor.execute(operation, options_json);
        if (!result.ok()) {
            return fail("Query " + operation, result.error());
        }
        std::cout << query::ToJson(result.value()) << std::endl;
        return 0;
    }

    int sample() {
        auto papers = filter_.filtered_papers(config_.criteria.lookback_years);
        if (!papers.ok()) {
            return fail("Filtering", papers.error());
        }
        pipeline::SampleMaterializer materializer(counting_, config_.corpus(), config_.sample());
        auto summary = materializer.materialize(*papers.value());
        if (!summary.ok()) {
            return fail("Sample materialization", summary.error());
        }
        const auto& s = summary.value();
        rapidjson::StringBuffer buffer;
        JsonWriter writer(buffer);
        writer.StartObject();
        writer.Key("directory");
        writer.String(s.directory.c_str());
        writer.Key("papers");
        writer.Int64(s.papers);
        writer.Key("references");
        writer.Int64(s.references);
        writer.Key("authorships");
        writer.Int64(s.authorships);
        writer.Key("field_assignments");
        writer.Int64(s.field_assignments);
        writer.Key("patent_links");
        writer.Int64(s.patent_links);
        writer.Key("fields");
        writer.Int64(s.fields);
        writer.EndObject();
        std::cout << buffer.GetString() << std::endl;
        return 0;
    }

    core::EngineConfig config_;
    std::shared_ptr<storage::CountingStore> counting_;
    storage::DiskCache cache_;
    pipeline::CorpusFilter filter_;
    graph::GraphBuilder builder_;
};

} // namespace scigraph

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " COMMAND [OPTIONS]" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  filter               Filter the corpus and report the paper count" << std::endl;
    std::cout << "  graph                Print the graph as JSON" << std::endl;
    std::cout << "  metrics              Print per-node metrics" << std::endl;
    std::cout << "  communities          Print the community assignment" << std::endl;
    std::cout << "  query                Run an ad-hoc query against the sample" << std::endl;
    std::cout << "  sample               Materialize the filtered papers as a sample" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --data-dir DIR       Corpus directory (default: data)" << std::endl;
    std::cout << "  --sample-dir DIR     Sample directory (default: data/sample)" << std::endl;
    std::cout << "  --cache-dir DIR      Cache directory (default: data/cache)" << std::endl;
    std::cout << "  --years N            Lookback window in years (default: 5)" << std::endl;
    std::cout << "  --current-year YEAR  Reference year of the window (default: this year)" << std::endl;
    std::cout << "  --institution ID     Institution id" << std::endl;
    std::cout << "  --field ID           Field id" << std::endl;
    std::cout << "  --graph KIND         citation or collaboration (default: citation)" << std::endl;
    std::cout << "  --algorithm NAME     louvain or singleton (default: louvain)" << std::endl;
    std::cout << "  --operation NAME     Query operation" << std::endl;
    std::cout << "  --options JSON       Query options object" << std::endl;
    std::cout << "  --memory-limit SIZE  Store memory limit (default: 8GB)" << std::endl;
    std::cout << "  --threads N          Store worker threads (default: 4)" << std::endl;
    std::cout << "  --log-level LEVEL    trace, debug, info, warn, error, off" << std::endl;
    std::cout << "  --stats              Print store call counts to stderr" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

bool ParseInt(const std::string& text, int* out) {
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0') {
        return false;
    }
    *out = static_cast<int>(value);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    scigraph::common::Logger::Init();

    scigraph::core::EngineConfig config = scigraph::core::EngineConfig::FromEnvironment();
    scigraph::CommandLine cli;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        int number = 0;
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--data-dir" && has_value) {
            config.data_dir = argv[++i];
        } else if (arg == "--sample-dir" && has_value) {
            config.sample_dir = argv[++i];
        } else if (arg == "--cache-dir" && has_value) {
            config.cache_dir = argv[++i];
        } else if (arg == "--years" && has_value && ParseInt(argv[i + 1], &number)) {
            config.criteria.lookback_years = number;
            ++i;
        } else if (arg == "--current-year" && has_value && ParseInt(argv[i + 1], &number)) {
            config.current_year = number;
            ++i;
        } else if (arg == "--institution" && has_value) {
            config.criteria.institution_id = argv[++i];
        } else if (arg == "--field" && has_value) {
            config.criteria.field_id = argv[++i];
        } else if (arg == "--graph" && has_value) {
            cli.graph_kind = argv[++i];
        } else if (arg == "--algorithm" && has_value) {
            std::string name = argv[++i];
            if (name == "louvain") {
                config.community_algorithm = scigraph::core::CommunityAlgorithm::LOUVAIN;
            } else if (name == "singleton") {
                config.community_algorithm = scigraph::core::CommunityAlgorithm::SINGLETON;
            } else {
                std::cerr << "Unknown community algorithm: " << name << std::endl;
                return 1;
            }
        } else if (arg == "--operation" && has_value) {
            cli.operation = argv[++i];
        } else if (arg == "--options" && has_value) {
            cli.options_json = argv[++i];
        } else if (arg == "--memory-limit" && has_value) {
            config.store.memory_limit = argv[++i];
        } else if (arg == "--threads" && has_value && ParseInt(argv[i + 1], &number)) {
            config.store.threads = number;
            ++i;
        } else if (arg == "--log-level" && has_value) {
            std::string level = argv[++i];
            if (!scigraph::common::Logger::SetLevel(level)) {
                std::cerr << "Unknown log level: " << level << ". Using default (info)." << std::endl;
            }
        } else if (arg == "--stats") {
            cli.print_stats = true;
        } else if (cli.command.empty() && arg.rfind("--", 0) != 0) {
            cli.command = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    }

    if (cli.command.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }
    auto valid = config.Validate();
    if (!valid.ok()) {
        std::cerr << "Invalid configuration: " << valid.error() << std::endl;
        return 1;
    }

    try {
        scigraph::Engine engine(config);
        const int status = engine.run(cli);
        if (cli.print_stats) {
            std::cerr << engine.stats() << std::endl;
        }
        return status;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
