#ifndef SCIGRAPH_CORE_TYPES_H_
#define SCIGRAPH_CORE_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace scigraph {
namespace core {

using PaperId = std::string;
using AuthorId = std::string;
using PaperIdSet = std::unordered_set<PaperId>;

enum class DocType {
    ARTICLE,
    OTHER
};

enum class AuthorPosition {
    FIRST,
    MIDDLE,
    LAST
};

// String forms match the values stored in the corpus files
std::string ToString(DocType doctype);
std::string ToString(AuthorPosition position);
DocType ParseDocType(const std::string& value);
std::optional<AuthorPosition> ParseAuthorPosition(const std::string& value);

/**
 * @brief One row of the papers table
 */
struct Paper {
    PaperId paper_id;
    int32_t year = 0;
    DocType doctype = DocType::OTHER;
    bool is_retracted = false;
    int64_t cited_by_count = 0;
    int64_t patent_count = 0;
};

/**
 * @brief Paper-author-affiliation triple
 */
struct Authorship {
    PaperId paper_id;
    AuthorId author_id;
    std::string institution_id;
    AuthorPosition position = AuthorPosition::MIDDLE;
};

struct FieldAssignment {
    PaperId paper_id;
    std::string field_id;
};

struct Field {
    std::string field_id;
    std::string display_name;
};

struct Citation {
    PaperId citing_paper_id;
    PaperId cited_paper_id;
};

struct PatentLink {
    PaperId paper_id;
    std::string patent_id;
};

/**
 * @brief Weighted edge as persisted in edge-list caches
 */
struct EdgeRecord {
    std::string source;
    std::string target;
    int64_t weight = 1;

    EdgeRecord() = default;
    EdgeRecord(std::string src, std::string dst, int64_t w)
        : source(std::move(src)), target(std::move(dst)), weight(w) {}

    bool operator==(const EdgeRecord& other) const {
        return source == other.source && target == other.target && weight == other.weight;
    }
};

/**
 * @brief The fixed predicate tuple that defines the filtered corpus
 *
 * Everything except lookback_years contributes to the filter signature;
 * the lookback window is a separate component of every cache key.
 */
struct FilterCriteria {
    std::string institution_id;
    std::string field_id;
    int lookback_years;
    DocType doctype;
    bool exclude_retracted;
    AuthorPosition author_position;

    FilterCriteria()
        : institution_id("I78577930"),     // Columbia University (OpenAlex)
          field_id("C41008148"),           // Computer science
          lookback_years(5),
          doctype(DocType::ARTICLE),
          exclude_retracted(true),
          author_position(AuthorPosition::FIRST) {}

    FilterCriteria WithLookback(int years) const {
        FilterCriteria copy = *this;
        copy.lookback_years = years;
        return copy;
    }
};

/**
 * @brief Where a paper table came from; downstream caches key on it
 */
struct TableProvenance {
    int lookback_years = 0;
    std::string signature;
};

/**
 * @brief Attribute table of a filtered paper subset
 */
struct PaperTable {
    std::vector<Paper> papers;
    std::optional<TableProvenance> provenance;

    bool empty() const { return papers.empty(); }
    size_t size() const { return papers.size(); }

    PaperIdSet id_set() const {
        PaperIdSet ids;
        ids.reserve(papers.size());
        for (const auto& paper : papers) {
            ids.insert(paper.paper_id);
        }
        return ids;
    }
};

} // namespace core
} // namespace scigraph

#endif // SCIGRAPH_CORE_TYPES_H_
