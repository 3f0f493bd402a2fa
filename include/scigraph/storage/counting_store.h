#ifndef SCIGRAPH_STORAGE_COUNTING_STORE_H_
#define SCIGRAPH_STORAGE_COUNTING_STORE_H_

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "scigraph/storage/columnar_store.h"

namespace scigraph {
namespace storage {

/**
 * @brief Decorator for ColumnarStore that counts the statements it forwards.
 *
 * Wraps an underlying store and passes every call through unchanged.
 */
class CountingStore : public ColumnarStore {
public:
    explicit CountingStore(std::shared_ptr<ColumnarStore> underlying);

    core::Result<RowSet> run(const std::string& sql) override;

    core::Result<void> register_strings(
        const std::string& table,
        const std::string& column,
        const std::vector<std::string>& values) override;

    bool file_exists(const std::string& path) const override;

    size_t query_count() const { return queries_.load(); }
    size_t registration_count() const { return registrations_.load(); }
    void reset();

    std::string stats() const;

private:
    std::shared_ptr<ColumnarStore> underlying_;
    std::atomic<size_t> queries_{0};
    std::atomic<size_t> registrations_{0};
};

} // namespace storage
} // namespace scigraph

#endif // SCIGRAPH_STORAGE_COUNTING_STORE_H_
