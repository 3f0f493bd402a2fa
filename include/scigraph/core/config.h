#ifndef SCIGRAPH_CORE_CONFIG_H_
#define SCIGRAPH_CORE_CONFIG_H_

#include <cstdint>
#include <string>

#include "scigraph/core/result.h"
#include "scigraph/core/types.h"

namespace scigraph {
namespace core {

/**
 * @brief Resource caps applied to the embedded SQL engine
 */
struct StoreConfig {
    std::string memory_limit;       // DuckDB memory_limit setting, e.g. "8GB"
    int threads;                    // Worker threads per query
    bool preserve_insertion_order;  // Off to let the engine stream large results

    StoreConfig() : memory_limit("8GB"), threads(4), preserve_insertion_order(false) {}

    static StoreConfig Default() {
        return StoreConfig();
    }
};

/**
 * @brief Locations of the corpus tables inside a data directory
 *
 * Every table is stored as `<directory>/<prefix><table>.parquet`.
 */
struct CorpusPaths {
    std::string directory;
    std::string prefix;

    CorpusPaths() : prefix("sciscinet_") {}
    CorpusPaths(std::string dir, std::string file_prefix)
        : directory(std::move(dir)), prefix(std::move(file_prefix)) {}

    std::string table(const std::string& name) const;

    std::string papers() const { return table("papers"); }
    std::string paper_refs() const { return table("paperrefs"); }
    std::string authorships() const { return table("paper_author_affiliation"); }
    std::string paper_fields() const { return table("paperfields"); }
    std::string patent_links() const { return table("link_patents"); }
    std::string fields() const { return table("fields"); }
};

/**
 * @brief Limits applied while deriving graphs from a paper table
 */
struct GraphConfig {
    // Papers with more qualifying institution authors contribute no pairs
    size_t max_coauthors_per_paper;

    GraphConfig() : max_coauthors_per_paper(50) {}

    static GraphConfig Default() {
        return GraphConfig();
    }
};

/**
 * @brief Parameters of the per-node metric computation
 */
struct MetricsConfig {
    size_t exact_betweenness_threshold;  // Exact betweenness below this node count
    size_t betweenness_sample_size;      // Source nodes sampled above it
    uint64_t seed;
    double damping;
    int max_iterations;
    double tolerance;

    MetricsConfig()
        : exact_betweenness_threshold(500),
          betweenness_sample_size(100),
          seed(42),
          damping(0.85),
          max_iterations(100),
          tolerance(1e-6) {}

    static MetricsConfig Default() {
        return MetricsConfig();
    }
};

enum class CommunityAlgorithm {
    LOUVAIN,
    SINGLETON
};

const char* ToString(CommunityAlgorithm algorithm);

/**
 * @brief Top-level configuration of the engine
 */
struct EngineConfig {
    std::string data_dir;        // Full corpus
    std::string sample_dir;      // Materialized subset read by the query layer
    std::string cache_dir;       // Disk cache for filtered artifacts
    std::string file_prefix;
    std::string sample_prefix;

    StoreConfig store;
    FilterCriteria criteria;

    // Reference year of the lookback window; 0 uses the system clock
    int current_year;

    GraphConfig graph;
    MetricsConfig metrics;
    CommunityAlgorithm community_algorithm;

    EngineConfig()
        : data_dir("data"),
          sample_dir("data/sample"),
          cache_dir("data/cache"),
          file_prefix("sciscinet_"),
          sample_prefix("sample_"),
          current_year(0),
          community_algorithm(CommunityAlgorithm::LOUVAIN) {}

    static EngineConfig Default() {
        return EngineConfig();
    }

    /**
     * @brief Default configuration overlaid with SCIGRAPH_* environment variables
     *
     * Recognized: SCIGRAPH_DATA_DIR, SCIGRAPH_SAMPLE_DIR, SCIGRAPH_CACHE_DIR,
     * SCIGRAPH_MEMORY_LIMIT, SCIGRAPH_THREADS, SCIGRAPH_INSTITUTION_ID,
     * SCIGRAPH_FIELD_ID, SCIGRAPH_YEARS_BACK. Unparseable numbers keep the default.
     */
    static EngineConfig FromEnvironment();

    Result<void> Validate() const;

    int ResolveCurrentYear() const;

    CorpusPaths corpus() const { return CorpusPaths(data_dir, file_prefix); }
    CorpusPaths sample() const { return CorpusPaths(sample_dir, sample_prefix); }
};

} // namespace core
} // namespace scigraph

#endif // SCIGRAPH_CORE_CONFIG_H_
