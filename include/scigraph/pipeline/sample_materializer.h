#ifndef SCIGRAPH_PIPELINE_SAMPLE_MATERIALIZER_H_
#define SCIGRAPH_PIPELINE_SAMPLE_MATERIALIZER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "scigraph/core/config.h"
#include "scigraph/core/result.h"
#include "scigraph/core/types.h"
#include "scigraph/storage/columnar_store.h"

namespace scigraph {
namespace pipeline {

/**
 * @brief Row counts of a materialized sample
 */
struct SampleSummary {
    std::string directory;
    int64_t papers = 0;
    int64_t references = 0;
    int64_t authorships = 0;
    int64_t field_assignments = 0;
    int64_t patent_links = 0;
    int64_t fields = 0;
};

/**
 * @brief Copies the corpus rows touching a paper subset into a sample directory
 *
 * Writes one Parquet file per corpus table under the target paths: the
 * papers themselves, references with either endpoint in the subset, their
 * authorships, field assignments and patent links, and the fields those
 * assignments refer to. The ad-hoc query layer reads the result.
 */
class SampleMaterializer {
public:
    SampleMaterializer(std::shared_ptr<storage::ColumnarStore> store,
                       core::CorpusPaths source,
                       core::CorpusPaths target);

    core::Result<SampleSummary> materialize(const core::PaperTable& papers);

private:
    core::Result<int64_t> copy_to(const std::string& select_sql, const std::string& path);

    std::shared_ptr<storage::ColumnarStore> store_;
    core::CorpusPaths source_;
    core::CorpusPaths target_;
};

} // namespace pipeline
} // namespace scigraph

#endif // SCIGRAPH_PIPELINE_SAMPLE_MATERIALIZER_H_
