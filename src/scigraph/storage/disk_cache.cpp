#include "scigraph/storage/disk_cache.h"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "scigraph/common/logger.h"
#include "scigraph/storage/parquet/reader.hpp"
#include "scigraph/storage/parquet/schema_mapper.hpp"
#include "scigraph/storage/parquet/writer.hpp"

namespace scigraph {
namespace storage {

namespace fs = std::filesystem;

namespace {

struct EdgeColumns {
    const char* source;
    const char* target;
};

EdgeColumns ColumnsFor(ArtifactKind kind) {
    if (kind == ArtifactKind::COAUTHOR_PAIRS) {
        return {"author1", "author2"};
    }
    return {"citing_paperid", "cited_paperid"};
}

// Reads the named columns, or the whole file when none are named
core::Result<std::shared_ptr<arrow::Table>> ReadCacheFile(const std::string& path,
                                                          const std::vector<std::string>& columns = {}) {
    parquet::ParquetReader reader;
    auto opened = reader.Open(path);
    if (!opened.ok()) {
        return core::Result<std::shared_ptr<arrow::Table>>::error_from(opened);
    }
    auto table = columns.empty() ? reader.ReadTable() : reader.ReadColumns(columns);
    auto closed = reader.Close();
    if (table.ok() && !closed.ok()) {
        SCIGRAPH_DEBUG("Closing cache file {} failed: {}", path, closed.error());
    }
    return table;
}

CacheLookup<core::PaperIdSet> LoadIdFile(const std::string& path) {
    using Lookup = CacheLookup<core::PaperIdSet>;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Lookup::Miss();
    }
    auto table = ReadCacheFile(path, {"paperid"});
    if (!table.ok()) {
        return Lookup::Corrupt(table.error());
    }
    auto ids = parquet::SchemaMapper::ToIdSet(table.value());
    if (!ids.ok()) {
        return Lookup::Corrupt(ids.error());
    }
    return Lookup::Hit(ids.take_value());
}

} // namespace

const char* ArtifactPrefix(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::PAPER_IDS: return "filtered_paper_ids";
        case ArtifactKind::PAPER_TABLE: return "filtered_papers";
        case ArtifactKind::CITATION_EDGES: return "citation_network";
        case ArtifactKind::COAUTHOR_PAIRS: return "coauthor_pairs";
        case ArtifactKind::TEMP_PAPER_IDS: return "temp_paper_ids";
    }
    return "unknown";
}

DiskCache::DiskCache(std::string directory) : directory_(std::move(directory)) {}

std::string DiskCache::path_for(const CacheKey& key) const {
    std::string name = std::string(ArtifactPrefix(key.kind)) + "_" +
                       std::to_string(key.lookback_years) + "yr_" + key.signature + ".parquet";
    return (fs::path(directory_) / name).string();
}

std::string DiskCache::legacy_path(ArtifactKind kind, int lookback_years) const {
    std::string name = std::string(ArtifactPrefix(kind)) + "_" +
                       std::to_string(lookback_years) + "yr.parquet";
    return (fs::path(directory_) / name).string();
}

bool DiskCache::exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

core::Result<void> DiskCache::remove(const std::string& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return core::Result<void>::error("Failed to remove " + path + ": " + ec.message());
    }
    return core::Result<void>();
}

core::Result<void> DiskCache::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return core::Result<void>::error("Failed to create cache directory " + directory_ +
                                         ": " + ec.message());
    }
    return core::Result<void>();
}

CacheLookup<core::PaperIdSet> DiskCache::load_ids(const CacheKey& key) const {
    return LoadIdFile(path_for(key));
}

CacheLookup<core::PaperIdSet> DiskCache::load_legacy_ids(int lookback_years) const {
    return LoadIdFile(legacy_path(ArtifactKind::PAPER_IDS, lookback_years));
}

CacheLookup<core::PaperTable> DiskCache::load_papers(const CacheKey& key) const {
    using Lookup = CacheLookup<core::PaperTable>;
    const std::string path = path_for(key);
    if (!exists(path)) {
        return Lookup::Miss();
    }
    auto table = ReadCacheFile(path);
    if (!table.ok()) {
        return Lookup::Corrupt(table.error());
    }
    // A paper table without a year column cannot serve downstream consumers
    auto papers = parquet::SchemaMapper::ToPapers(table.value());
    if (!papers.ok()) {
        return Lookup::Corrupt(papers.error());
    }

    core::PaperTable result;
    result.papers = papers.take_value();
    result.provenance = core::TableProvenance{key.lookback_years, key.signature};
    return Lookup::Hit(std::move(result));
}

CacheLookup<std::vector<core::EdgeRecord>> DiskCache::load_edges(const CacheKey& key) const {
    using Lookup = CacheLookup<std::vector<core::EdgeRecord>>;
    const std::string path = path_for(key);
    if (!exists(path)) {
        return Lookup::Miss();
    }
    const EdgeColumns columns = ColumnsFor(key.kind);
    auto table = ReadCacheFile(path, {columns.source, columns.target, "weight"});
    if (!table.ok()) {
        return Lookup::Corrupt(table.error());
    }
    auto edges = parquet::SchemaMapper::ToEdges(table.value(), columns.source, columns.target);
    if (!edges.ok()) {
        return Lookup::Corrupt(edges.error());
    }
    return Lookup::Hit(edges.take_value());
}

namespace {

// Writes next to the destination and renames into place
core::Result<void> WriteAtomically(const std::string& path,
                                   core::Result<std::shared_ptr<arrow::RecordBatch>> batch) {
    if (!batch.ok()) {
        return core::Result<void>::error_from(batch);
    }
    const std::string staging = path + ".tmp";
    auto written = parquet::WriteParquetFile(staging, batch.value());
    if (!written.ok()) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        return written;
    }
    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        fs::remove(staging, ec);
        return core::Result<void>::error("Failed to move cache file into place: " + path);
    }
    return core::Result<void>();
}

} // namespace

core::Result<void> DiskCache::store_ids(const CacheKey& key, const core::PaperIdSet& ids) const {
    auto dir = ensure_directory();
    if (!dir.ok()) {
        return dir;
    }
    return WriteAtomically(path_for(key), parquet::SchemaMapper::ToRecordBatch(ids));
}

core::Result<void> DiskCache::store_papers(const CacheKey& key, const core::PaperTable& table) const {
    auto dir = ensure_directory();
    if (!dir.ok()) {
        return dir;
    }
    return WriteAtomically(path_for(key), parquet::SchemaMapper::ToRecordBatch(table.papers));
}

core::Result<void> DiskCache::store_edges(const CacheKey& key,
                                          const std::vector<core::EdgeRecord>& edges) const {
    auto dir = ensure_directory();
    if (!dir.ok()) {
        return dir;
    }
    const EdgeColumns columns = ColumnsFor(key.kind);
    return WriteAtomically(path_for(key),
                           parquet::SchemaMapper::ToRecordBatch(edges, columns.source, columns.target));
}

} // namespace storage
} // namespace scigraph
