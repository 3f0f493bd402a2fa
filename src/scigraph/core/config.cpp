#include "scigraph/core/config.h"

#include <cstdlib>
#include <ctime>

namespace scigraph {
namespace core {

namespace {

const char* GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

bool ParseInt(const char* text, int* out) {
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0') {
        return false;
    }
    *out = static_cast<int>(parsed);
    return true;
}

} // namespace

std::string CorpusPaths::table(const std::string& name) const {
    std::string path = directory;
    if (!path.empty() && path.back() != '/') {
        path += '/';
    }
    return path + prefix + name + ".parquet";
}

const char* ToString(CommunityAlgorithm algorithm) {
    switch (algorithm) {
        case CommunityAlgorithm::SINGLETON: return "singleton";
        case CommunityAlgorithm::LOUVAIN:
        default:
            return "louvain";
    }
}

EngineConfig EngineConfig::FromEnvironment() {
    EngineConfig config = Default();

    if (const char* v = GetEnv("SCIGRAPH_DATA_DIR")) config.data_dir = v;
    if (const char* v = GetEnv("SCIGRAPH_SAMPLE_DIR")) config.sample_dir = v;
    if (const char* v = GetEnv("SCIGRAPH_CACHE_DIR")) config.cache_dir = v;
    if (const char* v = GetEnv("SCIGRAPH_MEMORY_LIMIT")) config.store.memory_limit = v;
    if (const char* v = GetEnv("SCIGRAPH_INSTITUTION_ID")) config.criteria.institution_id = v;
    if (const char* v = GetEnv("SCIGRAPH_FIELD_ID")) config.criteria.field_id = v;

    int parsed = 0;
    if (const char* v = GetEnv("SCIGRAPH_THREADS")) {
        if (ParseInt(v, &parsed)) config.store.threads = parsed;
    }
    if (const char* v = GetEnv("SCIGRAPH_YEARS_BACK")) {
        if (ParseInt(v, &parsed)) config.criteria.lookback_years = parsed;
    }
    return config;
}

Result<void> EngineConfig::Validate() const {
    if (data_dir.empty()) {
        return Result<void>::error("data_dir must not be empty", Error::Code::INVALID_ARGUMENT);
    }
    if (cache_dir.empty()) {
        return Result<void>::error("cache_dir must not be empty", Error::Code::INVALID_ARGUMENT);
    }
    if (store.memory_limit.empty()) {
        return Result<void>::error("memory_limit must not be empty", Error::Code::INVALID_ARGUMENT);
    }
    if (store.threads <= 0) {
        return Result<void>::error("threads must be positive, got " + std::to_string(store.threads),
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (criteria.institution_id.empty() || criteria.field_id.empty()) {
        return Result<void>::error("institution and field ids are required",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (criteria.lookback_years < 0) {
        return Result<void>::error("lookback window must be non-negative, got " +
                                   std::to_string(criteria.lookback_years),
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (current_year < 0) {
        return Result<void>::error("current_year must be 0 or a calendar year",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (graph.max_coauthors_per_paper == 0) {
        return Result<void>::error("max_coauthors_per_paper must be positive",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (metrics.betweenness_sample_size == 0) {
        return Result<void>::error("betweenness_sample_size must be positive",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (metrics.damping <= 0.0 || metrics.damping >= 1.0) {
        return Result<void>::error("damping must be in (0, 1)", Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

int EngineConfig::ResolveCurrentYear() const {
    if (current_year > 0) {
        return current_year;
    }
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return local.tm_year + 1900;
}

} // namespace core
} // namespace scigraph
