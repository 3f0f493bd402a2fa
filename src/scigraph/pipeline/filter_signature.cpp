#include "scigraph/pipeline/filter_signature.h"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace scigraph {
namespace pipeline {

std::string SerializeCriteria(const core::FilterCriteria& criteria) {
    std::ostringstream ss;
    ss << "v" << kCacheSchemaVersion
       << "|institution=" << criteria.institution_id
       << "|field=" << criteria.field_id
       << "|doctype=" << core::ToString(criteria.doctype)
       << "|exclude_retracted=" << (criteria.exclude_retracted ? 1 : 0)
       << "|author_position=" << core::ToString(criteria.author_position);
    return ss.str();
}

std::string FilterSignature(const core::FilterCriteria& criteria) {
    const std::string text = SerializeCriteria(criteria);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.c_str()), text.length(), hash);

    std::stringstream ss;
    for (int i = 0; i < 8; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace pipeline
} // namespace scigraph
