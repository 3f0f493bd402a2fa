#ifndef SCIGRAPH_PIPELINE_FILTER_SIGNATURE_H_
#define SCIGRAPH_PIPELINE_FILTER_SIGNATURE_H_

#include <string>

#include "scigraph/core/types.h"

namespace scigraph {
namespace pipeline {

// Bumped whenever the layout of cached artifacts changes
constexpr int kCacheSchemaVersion = 2;

/**
 * @brief Canonical text form of the fixed predicate tuple
 *
 * Covers institution, field, doctype, retraction constraint and author
 * position. The lookback window is deliberately absent: it is a separate
 * component of every cache key.
 */
std::string SerializeCriteria(const core::FilterCriteria& criteria);

/**
 * @brief First 16 hex characters of SHA-256 over SerializeCriteria()
 */
std::string FilterSignature(const core::FilterCriteria& criteria);

} // namespace pipeline
} // namespace scigraph

#endif // SCIGRAPH_PIPELINE_FILTER_SIGNATURE_H_
