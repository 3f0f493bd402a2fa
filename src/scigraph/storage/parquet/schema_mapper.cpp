#include "scigraph/storage/parquet/schema_mapper.hpp"
#include <arrow/builder.h>
#include <algorithm>

namespace scigraph {
namespace storage {
namespace parquet {

namespace {

using BatchResult = core::Result<std::shared_ptr<arrow::RecordBatch>>;

std::string MissingColumn(const std::string& name) {
    return "Column '" + name + "' not found";
}

core::Result<std::vector<std::string>> StringValues(const arrow::Table& table, const std::string& name) {
    using R = core::Result<std::vector<std::string>>;
    auto column = table.GetColumnByName(name);
    if (!column) {
        return R::error(MissingColumn(name), core::Error::Code::SCHEMA);
    }

    std::vector<std::string> values;
    values.reserve(static_cast<size_t>(column->length()));
    for (const auto& chunk : column->chunks()) {
        switch (chunk->type_id()) {
            case arrow::Type::STRING: {
                const auto& arr = static_cast<const arrow::StringArray&>(*chunk);
                for (int64_t i = 0; i < arr.length(); ++i) {
                    values.push_back(arr.IsNull(i) ? std::string() : arr.GetString(i));
                }
                break;
            }
            case arrow::Type::LARGE_STRING: {
                const auto& arr = static_cast<const arrow::LargeStringArray&>(*chunk);
                for (int64_t i = 0; i < arr.length(); ++i) {
                    values.push_back(arr.IsNull(i) ? std::string() : arr.GetString(i));
                }
                break;
            }
            default:
                return R::error("Column '" + name + "' has type " + chunk->type()->ToString() +
                                ", expected string", core::Error::Code::SCHEMA);
        }
    }
    return R(std::move(values));
}

template <typename ArrayType>
void AppendIntegers(const arrow::Array& chunk, std::vector<int64_t>* out) {
    const auto& arr = static_cast<const ArrayType&>(chunk);
    for (int64_t i = 0; i < arr.length(); ++i) {
        out->push_back(arr.IsNull(i) ? 0 : static_cast<int64_t>(arr.Value(i)));
    }
}

core::Result<std::vector<int64_t>> IntegerValues(const arrow::Table& table, const std::string& name) {
    using R = core::Result<std::vector<int64_t>>;
    auto column = table.GetColumnByName(name);
    if (!column) {
        return R::error(MissingColumn(name), core::Error::Code::SCHEMA);
    }

    std::vector<int64_t> values;
    values.reserve(static_cast<size_t>(column->length()));
    for (const auto& chunk : column->chunks()) {
        switch (chunk->type_id()) {
            case arrow::Type::INT8: AppendIntegers<arrow::Int8Array>(*chunk, &values); break;
            case arrow::Type::INT16: AppendIntegers<arrow::Int16Array>(*chunk, &values); break;
            case arrow::Type::INT32: AppendIntegers<arrow::Int32Array>(*chunk, &values); break;
            case arrow::Type::INT64: AppendIntegers<arrow::Int64Array>(*chunk, &values); break;
            case arrow::Type::UINT32: AppendIntegers<arrow::UInt32Array>(*chunk, &values); break;
            case arrow::Type::UINT64: AppendIntegers<arrow::UInt64Array>(*chunk, &values); break;
            default:
                return R::error("Column '" + name + "' has type " + chunk->type()->ToString() +
                                ", expected integer", core::Error::Code::SCHEMA);
        }
    }
    return R(std::move(values));
}

core::Result<std::vector<bool>> BoolValues(const arrow::Table& table, const std::string& name) {
    using R = core::Result<std::vector<bool>>;
    auto column = table.GetColumnByName(name);
    if (!column) {
        return R::error(MissingColumn(name), core::Error::Code::SCHEMA);
    }

    std::vector<bool> values;
    values.reserve(static_cast<size_t>(column->length()));
    for (const auto& chunk : column->chunks()) {
        if (chunk->type_id() != arrow::Type::BOOL) {
            return R::error("Column '" + name + "' has type " + chunk->type()->ToString() +
                            ", expected bool", core::Error::Code::SCHEMA);
        }
        const auto& arr = static_cast<const arrow::BooleanArray&>(*chunk);
        for (int64_t i = 0; i < arr.length(); ++i) {
            values.push_back(!arr.IsNull(i) && arr.Value(i));
        }
    }
    return R(std::move(values));
}

BatchResult BuildFailed(const arrow::Status& status) {
    return BatchResult::error("Failed to build record batch: " + status.ToString(),
                              core::Error::Code::INTERNAL);
}

} // namespace

std::shared_ptr<arrow::Schema> SchemaMapper::IdSetSchema() {
    return arrow::schema({arrow::field("paperid", arrow::utf8(), false)});
}

std::shared_ptr<arrow::Schema> SchemaMapper::PaperTableSchema() {
    return arrow::schema({
        arrow::field("paperid", arrow::utf8(), false),
        arrow::field("year", arrow::int32(), false),
        arrow::field("doctype", arrow::utf8(), true),
        arrow::field("is_retracted", arrow::boolean(), true),
        arrow::field("cited_by_count", arrow::int64(), true),
        arrow::field("patent_count", arrow::int64(), true),
    });
}

std::shared_ptr<arrow::Schema> SchemaMapper::EdgeListSchema(const std::string& source_column,
                                                            const std::string& target_column) {
    return arrow::schema({
        arrow::field(source_column, arrow::utf8(), false),
        arrow::field(target_column, arrow::utf8(), false),
        arrow::field("weight", arrow::int64(), false),
    });
}

BatchResult SchemaMapper::ToRecordBatch(const core::PaperIdSet& ids) {
    std::vector<std::string> sorted(ids.begin(), ids.end());
    std::sort(sorted.begin(), sorted.end());

    arrow::StringBuilder builder;
    arrow::Status status = builder.Reserve(static_cast<int64_t>(sorted.size()));
    for (const auto& id : sorted) {
        status &= builder.Append(id);
    }
    std::shared_ptr<arrow::Array> array;
    status &= builder.Finish(&array);
    if (!status.ok()) {
        return BuildFailed(status);
    }
    return BatchResult(arrow::RecordBatch::Make(IdSetSchema(), static_cast<int64_t>(sorted.size()), {array}));
}

BatchResult SchemaMapper::ToRecordBatch(const std::vector<core::Paper>& papers) {
    arrow::StringBuilder id_builder;
    arrow::Int32Builder year_builder;
    arrow::StringBuilder doctype_builder;
    arrow::BooleanBuilder retracted_builder;
    arrow::Int64Builder citations_builder;
    arrow::Int64Builder patents_builder;

    const auto n = static_cast<int64_t>(papers.size());
    arrow::Status status = id_builder.Reserve(n);
    status &= year_builder.Reserve(n);
    status &= doctype_builder.Reserve(n);
    status &= retracted_builder.Reserve(n);
    status &= citations_builder.Reserve(n);
    status &= patents_builder.Reserve(n);

    for (const auto& paper : papers) {
        status &= id_builder.Append(paper.paper_id);
        status &= year_builder.Append(paper.year);
        status &= doctype_builder.Append(core::ToString(paper.doctype));
        status &= retracted_builder.Append(paper.is_retracted);
        status &= citations_builder.Append(paper.cited_by_count);
        status &= patents_builder.Append(paper.patent_count);
    }

    std::shared_ptr<arrow::Array> ids, years, doctypes, retracted, citations, patents;
    status &= id_builder.Finish(&ids);
    status &= year_builder.Finish(&years);
    status &= doctype_builder.Finish(&doctypes);
    status &= retracted_builder.Finish(&retracted);
    status &= citations_builder.Finish(&citations);
    status &= patents_builder.Finish(&patents);
    if (!status.ok()) {
        return BuildFailed(status);
    }
    return BatchResult(arrow::RecordBatch::Make(
        PaperTableSchema(), n, {ids, years, doctypes, retracted, citations, patents}));
}

BatchResult SchemaMapper::ToRecordBatch(const std::vector<core::EdgeRecord>& edges,
                                        const std::string& source_column,
                                        const std::string& target_column) {
    arrow::StringBuilder source_builder;
    arrow::StringBuilder target_builder;
    arrow::Int64Builder weight_builder;

    const auto n = static_cast<int64_t>(edges.size());
    arrow::Status status = source_builder.Reserve(n);
    status &= target_builder.Reserve(n);
    status &= weight_builder.Reserve(n);
    for (const auto& edge : edges) {
        status &= source_builder.Append(edge.source);
        status &= target_builder.Append(edge.target);
        status &= weight_builder.Append(edge.weight);
    }

    std::shared_ptr<arrow::Array> sources, targets, weights;
    status &= source_builder.Finish(&sources);
    status &= target_builder.Finish(&targets);
    status &= weight_builder.Finish(&weights);
    if (!status.ok()) {
        return BuildFailed(status);
    }
    return BatchResult(arrow::RecordBatch::Make(
        EdgeListSchema(source_column, target_column), n, {sources, targets, weights}));
}

core::Result<core::PaperIdSet> SchemaMapper::ToIdSet(const std::shared_ptr<arrow::Table>& table) {
    auto values = StringValues(*table, "paperid");
    if (!values.ok()) {
        return core::Result<core::PaperIdSet>::error_from(values);
    }
    const auto& ids = values.value();
    return core::Result<core::PaperIdSet>(core::PaperIdSet(ids.begin(), ids.end()));
}

core::Result<std::vector<core::Paper>> SchemaMapper::ToPapers(const std::shared_ptr<arrow::Table>& table) {
    using R = core::Result<std::vector<core::Paper>>;

    auto ids = StringValues(*table, "paperid");
    if (!ids.ok()) return R::error_from(ids);
    auto years = IntegerValues(*table, "year");
    if (!years.ok()) return R::error_from(years);

    const auto& id_values = ids.value();
    const auto& year_values = years.value();
    std::vector<core::Paper> papers(id_values.size());
    for (size_t i = 0; i < papers.size(); ++i) {
        papers[i].paper_id = id_values[i];
        papers[i].year = static_cast<int32_t>(year_values[i]);
    }

    // Remaining attributes are optional in the file
    const auto schema = table->schema();
    if (schema->GetFieldIndex("doctype") >= 0) {
        auto doctypes = StringValues(*table, "doctype");
        if (!doctypes.ok()) return R::error_from(doctypes);
        for (size_t i = 0; i < papers.size(); ++i) {
            papers[i].doctype = core::ParseDocType(doctypes.value()[i]);
        }
    }
    if (schema->GetFieldIndex("is_retracted") >= 0) {
        auto retracted = BoolValues(*table, "is_retracted");
        if (!retracted.ok()) return R::error_from(retracted);
        for (size_t i = 0; i < papers.size(); ++i) {
            papers[i].is_retracted = retracted.value()[i];
        }
    }
    if (schema->GetFieldIndex("cited_by_count") >= 0) {
        auto citations = IntegerValues(*table, "cited_by_count");
        if (!citations.ok()) return R::error_from(citations);
        for (size_t i = 0; i < papers.size(); ++i) {
            papers[i].cited_by_count = citations.value()[i];
        }
    }
    if (schema->GetFieldIndex("patent_count") >= 0) {
        auto patents = IntegerValues(*table, "patent_count");
        if (!patents.ok()) return R::error_from(patents);
        for (size_t i = 0; i < papers.size(); ++i) {
            papers[i].patent_count = patents.value()[i];
        }
    }
    return R(std::move(papers));
}

core::Result<std::vector<core::EdgeRecord>> SchemaMapper::ToEdges(
    const std::shared_ptr<arrow::Table>& table,
    const std::string& source_column,
    const std::string& target_column) {
    using R = core::Result<std::vector<core::EdgeRecord>>;

    auto sources = StringValues(*table, source_column);
    if (!sources.ok()) return R::error_from(sources);
    auto targets = StringValues(*table, target_column);
    if (!targets.ok()) return R::error_from(targets);
    auto weights = IntegerValues(*table, "weight");
    if (!weights.ok()) return R::error_from(weights);

    std::vector<core::EdgeRecord> edges;
    edges.reserve(sources.value().size());
    for (size_t i = 0; i < sources.value().size(); ++i) {
        edges.emplace_back(sources.value()[i], targets.value()[i], weights.value()[i]);
    }
    return R(std::move(edges));
}

} // namespace parquet
} // namespace storage
} // namespace scigraph
