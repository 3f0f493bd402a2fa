#ifndef SCIGRAPH_PIPELINE_CORPUS_FILTER_H_
#define SCIGRAPH_PIPELINE_CORPUS_FILTER_H_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "scigraph/core/config.h"
#include "scigraph/core/result.h"
#include "scigraph/core/types.h"
#include "scigraph/storage/columnar_store.h"
#include "scigraph/storage/disk_cache.h"

namespace scigraph {
namespace pipeline {

/**
 * @brief Produces the filtered paper subset for a lookback window
 *
 * A paper qualifies when the target institution holds the configured
 * author position on it, it is assigned the target field, its year lies in
 * [current_year - lookback, current_year], it has the required doctype and
 * it is not retracted.
 *
 * Results are memoized per window in this instance and persisted in the
 * disk cache under (kind, window, filter signature). Lookups go memory,
 * then disk, then the store.
 */
class CorpusFilter {
public:
    // Windows at or above this size are streamed through a temporary file
    static constexpr int kStreamingWindowYears = 10;
    static constexpr int64_t kStreamChunkRows = 50000;

    CorpusFilter(std::shared_ptr<storage::ColumnarStore> store,
                 core::CorpusPaths paths,
                 core::FilterCriteria criteria,
                 storage::DiskCache& cache,
                 int current_year);

    core::Result<std::shared_ptr<const core::PaperIdSet>> filtered_paper_ids(int lookback_years);

    /**
     * @brief Attribute table of the filtered papers
     *
     * An empty id set yields an empty table. The table carries its
     * provenance so graph caches can be keyed by the same window.
     */
    core::Result<std::shared_ptr<const core::PaperTable>> filtered_papers(int lookback_years);

    /**
     * @brief Patent-link cardinality for each id; ids without links map to 0
     *
     * A missing patent-link table yields all zeros.
     */
    core::Result<std::unordered_map<std::string, int64_t>> patent_counts(
        const std::vector<std::string>& paper_ids);

    // Drops the in-process caches; disk entries are left in place
    void invalidate();

    const std::string& signature() const { return signature_; }
    const core::FilterCriteria& criteria() const { return criteria_; }
    int current_year() const { return current_year_; }

    // Defining query of the filtered id set for a window
    std::string id_query(int lookback_years) const;

private:
    core::Result<core::PaperIdSet> query_ids(int lookback_years);
    core::Result<core::PaperIdSet> query_ids_streamed(int lookback_years);
    core::Result<core::PaperTable> query_papers(const core::PaperIdSet& ids);
    void retire_legacy_ids(int lookback_years, const core::PaperIdSet& fresh);

    std::shared_ptr<storage::ColumnarStore> store_;
    core::CorpusPaths paths_;
    core::FilterCriteria criteria_;
    storage::DiskCache& cache_;
    int current_year_;
    std::string signature_;

    // The paper-table path re-enters the id-set path under this lock
    std::recursive_mutex mutex_;
    std::map<int, std::shared_ptr<const core::PaperIdSet>> ids_by_window_;
    std::map<int, std::shared_ptr<const core::PaperTable>> papers_by_window_;
};

} // namespace pipeline
} // namespace scigraph

#endif // SCIGRAPH_PIPELINE_CORPUS_FILTER_H_
