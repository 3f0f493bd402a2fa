#include "scigraph/storage/counting_store.h"

#include <sstream>

#include "scigraph/core/error.h"

namespace scigraph {
namespace storage {

CountingStore::CountingStore(std::shared_ptr<ColumnarStore> underlying)
    : underlying_(std::move(underlying)) {
    if (!underlying_) {
        throw core::InvalidArgumentError("CountingStore requires an underlying store");
    }
}

core::Result<RowSet> CountingStore::run(const std::string& sql) {
    ++queries_;
    return underlying_->run(sql);
}

core::Result<void> CountingStore::register_strings(
    const std::string& table,
    const std::string& column,
    const std::vector<std::string>& values) {
    ++registrations_;
    return underlying_->register_strings(table, column, values);
}

bool CountingStore::file_exists(const std::string& path) const {
    return underlying_->file_exists(path);
}

void CountingStore::reset() {
    queries_ = 0;
    registrations_ = 0;
}

std::string CountingStore::stats() const {
    std::ostringstream ss;
    ss << "Store statistics:\n"
       << "  Queries: " << query_count() << "\n"
       << "  Registered tables: " << registration_count() << "\n";
    return ss.str();
}

} // namespace storage
} // namespace scigraph
