#ifndef SCIGRAPH_STORAGE_DISK_CACHE_H_
#define SCIGRAPH_STORAGE_DISK_CACHE_H_

#include <string>
#include <vector>

#include "scigraph/core/result.h"
#include "scigraph/core/types.h"

namespace scigraph {
namespace storage {

/**
 * @brief Kinds of artifacts persisted in the cache directory
 */
enum class ArtifactKind {
    PAPER_IDS,        // filtered_paper_ids_<N>yr_<sig>.parquet
    PAPER_TABLE,      // filtered_papers_<N>yr_<sig>.parquet
    CITATION_EDGES,   // citation_network_<N>yr_<sig>.parquet
    COAUTHOR_PAIRS,   // coauthor_pairs_<N>yr_<sig>.parquet
    TEMP_PAPER_IDS    // temp_paper_ids_<N>yr_<sig>.parquet
};

const char* ArtifactPrefix(ArtifactKind kind);

/**
 * @brief Identity of a cached artifact
 *
 * An entry is valid for exactly one filter signature; the lookback window
 * is a separate key component.
 */
struct CacheKey {
    ArtifactKind kind;
    int lookback_years;
    std::string signature;

    CacheKey(ArtifactKind k, int years, std::string sig)
        : kind(k), lookback_years(years), signature(std::move(sig)) {}
};

/**
 * @brief Outcome of a cache read
 *
 * MISS and CORRUPT both mean "recompute"; CORRUPT additionally carries
 * the reason the file was rejected.
 */
template<typename T>
struct CacheLookup {
    enum class Status {
        HIT,
        MISS,
        CORRUPT
    };

    Status status = Status::MISS;
    T value{};
    std::string detail;

    bool hit() const { return status == Status::HIT; }
    bool corrupt() const { return status == Status::CORRUPT; }

    static CacheLookup Hit(T v) {
        CacheLookup lookup;
        lookup.status = Status::HIT;
        lookup.value = std::move(v);
        return lookup;
    }

    static CacheLookup Miss() {
        return CacheLookup();
    }

    static CacheLookup Corrupt(std::string reason) {
        CacheLookup lookup;
        lookup.status = Status::CORRUPT;
        lookup.detail = std::move(reason);
        return lookup;
    }
};

/**
 * @brief Parquet-backed cache directory for filtered artifacts
 *
 * Files are written to a temporary name and renamed into place, so a
 * reader never observes a partially written entry. Every file is safe to
 * delete; a deleted entry is simply recomputed.
 */
class DiskCache {
public:
    explicit DiskCache(std::string directory);

    const std::string& directory() const { return directory_; }

    std::string path_for(const CacheKey& key) const;

    // Untagged file name used before entries carried a filter signature
    std::string legacy_path(ArtifactKind kind, int lookback_years) const;

    CacheLookup<core::PaperIdSet> load_ids(const CacheKey& key) const;
    CacheLookup<core::PaperTable> load_papers(const CacheKey& key) const;
    CacheLookup<std::vector<core::EdgeRecord>> load_edges(const CacheKey& key) const;

    // Reads the untagged id-set file for a window, if one exists
    CacheLookup<core::PaperIdSet> load_legacy_ids(int lookback_years) const;

    core::Result<void> store_ids(const CacheKey& key, const core::PaperIdSet& ids) const;
    core::Result<void> store_papers(const CacheKey& key, const core::PaperTable& table) const;
    core::Result<void> store_edges(const CacheKey& key, const std::vector<core::EdgeRecord>& edges) const;

    bool exists(const std::string& path) const;
    core::Result<void> remove(const std::string& path) const;

    core::Result<void> ensure_directory() const;

private:

    std::string directory_;
};

} // namespace storage
} // namespace scigraph

#endif // SCIGRAPH_STORAGE_DISK_CACHE_H_
