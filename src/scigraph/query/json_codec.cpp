#include "scigraph/query/json_codec.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace scigraph {
namespace query {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

core::Result<void> ParseObject(const std::string& json, rapidjson::Document& doc) {
    if (json.empty()) {
        doc.SetObject();
        return core::Result<void>();
    }
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return core::Result<void>::error("Options are not valid JSON", core::Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return core::Result<void>::error("Options must be a JSON object", core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<void>();
}

/**
 * Reads typed members of an options object. The first type mismatch is
 * remembered and later reads become no-ops.
 */
class OptionReader {
public:
    explicit OptionReader(const rapidjson::Value& object) : object_(object) {}

    void integer(const char* key, std::optional<int64_t>* out) {
        const rapidjson::Value* value = member(key);
        if (!value) return;
        if (!value->IsInt64()) {
            fail(key, "an integer");
            return;
        }
        *out = value->GetInt64();
    }

    void boolean(const char* key, std::optional<bool>* out) {
        const rapidjson::Value* value = member(key);
        if (!value) return;
        if (!value->IsBool()) {
            fail(key, "a boolean");
            return;
        }
        *out = value->GetBool();
    }

    void string(const char* key, std::optional<std::string>* out) {
        const rapidjson::Value* value = member(key);
        if (!value) return;
        if (!value->IsString()) {
            fail(key, "a string");
            return;
        }
        *out = std::string(value->GetString(), value->GetStringLength());
    }

    void strings(const char* key, std::vector<std::string>* out) {
        const rapidjson::Value* value = member(key);
        if (!value) return;
        if (!value->IsArray()) {
            fail(key, "an array of strings");
            return;
        }
        std::vector<std::string> items;
        for (const auto& item : value->GetArray()) {
            if (!item.IsString()) {
                fail(key, "an array of strings");
                return;
            }
            items.emplace_back(item.GetString(), item.GetStringLength());
        }
        *out = std::move(items);
    }

    void integer_pair(const char* key, std::optional<std::pair<int64_t, int64_t>>* out) {
        const rapidjson::Value* value = member(key);
        if (!value) return;
        if (!value->IsArray() || value->Size() != 2 || !(*value)[0].IsInt64() || !(*value)[1].IsInt64()) {
            fail(key, "a pair of integers");
            return;
        }
        *out = std::make_pair((*value)[0].GetInt64(), (*value)[1].GetInt64());
    }

    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }

private:
    const rapidjson::Value* member(const char* key) const {
        if (!ok()) return nullptr;
        auto it = object_.FindMember(key);
        if (it == object_.MemberEnd() || it->value.IsNull()) {
            return nullptr;
        }
        return &it->value;
    }

    void fail(const char* key, const char* expected) {
        error_ = std::string("Option '") + key + "' must be " + expected;
    }

    const rapidjson::Value& object_;
    std::string error_;
};

template<typename Options, typename Fill>
core::Result<Options> ParseOptions(const std::string& json, Fill fill) {
    using R = core::Result<Options>;
    rapidjson::Document doc;
    auto parsed = ParseObject(json, doc);
    if (!parsed.ok()) {
        return R::error_from(parsed);
    }
    Options options;
    OptionReader reader(doc);
    fill(reader, options);
    if (!reader.ok()) {
        return R::error(reader.error(), core::Error::Code::INVALID_ARGUMENT);
    }
    return R(std::move(options));
}

void WriteString(JsonWriter& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void WriteValue(JsonWriter& writer, const storage::Value& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        writer.Bool(*b);
    } else if (const auto* i = std::get_if<int64_t>(&value)) {
        writer.Int64(*i);
    } else if (const auto* d = std::get_if<double>(&value)) {
        writer.Double(*d);
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        WriteString(writer, *s);
    } else {
        writer.Null();
    }
}

void WriteSummary(JsonWriter& writer, const Summary& summary) {
    writer.StartObject();
    for (const auto& stat : summary.stats()) {
        WriteString(writer, stat.first);
        WriteValue(writer, stat.second);
    }
    for (const auto& record : summary.records()) {
        WriteString(writer, record.first);
        writer.StartObject();
        for (const auto& cell : record.second) {
            WriteString(writer, cell.first);
            WriteValue(writer, cell.second);
        }
        writer.EndObject();
    }
    writer.EndObject();
}

} // namespace

core::Result<FieldQueryOptions> ParseFieldQueryOptions(const std::string& json) {
    return ParseOptions<FieldQueryOptions>(json, [](OptionReader& r, FieldQueryOptions& o) {
        r.string("field_name", &o.field_name);
        r.integer("limit", &o.limit);
    });
}

core::Result<YearQueryOptions> ParseYearQueryOptions(const std::string& json) {
    return ParseOptions<YearQueryOptions>(json, [](OptionReader& r, YearQueryOptions& o) {
        r.integer("year", &o.year);
        r.integer("start_year", &o.start_year);
        r.integer("end_year", &o.end_year);
        r.integer("years", &o.years);
    });
}

core::Result<CitationQueryOptions> ParseCitationQueryOptions(const std::string& json) {
    return ParseOptions<CitationQueryOptions>(json, [](OptionReader& r, CitationQueryOptions& o) {
        r.integer("min_citations", &o.min_citations);
        r.integer("max_citations", &o.max_citations);
        r.integer("year", &o.year);
        r.string("field", &o.field);
    });
}

core::Result<PatentQueryOptions> ParsePatentQueryOptions(const std::string& json) {
    return ParseOptions<PatentQueryOptions>(json, [](OptionReader& r, PatentQueryOptions& o) {
        r.integer("min_patents", &o.min_patents);
        r.boolean("has_patents", &o.has_patents);
        r.integer("year", &o.year);
    });
}

core::Result<AdvancedQueryOptions> ParseAdvancedQueryOptions(const std::string& json) {
    return ParseOptions<AdvancedQueryOptions>(json, [](OptionReader& r, AdvancedQueryOptions& o) {
        r.string("field", &o.field);
        r.strings("fields", &o.fields);
        r.string("author_id", &o.author_id);
        r.integer("year", &o.year);
        r.integer("start_year", &o.start_year);
        r.integer("end_year", &o.end_year);
        r.integer_pair("year_range", &o.year_range);
        r.integer("min_citations", &o.min_citations);
        r.integer("max_citations", &o.max_citations);
        r.integer("min_patents", &o.min_patents);
        r.boolean("has_patents", &o.has_patents);
        r.integer("limit", &o.limit);
    });
}

core::Result<TopAuthorsOptions> ParseTopAuthorsOptions(const std::string& json) {
    return ParseOptions<TopAuthorsOptions>(json, [](OptionReader& r, TopAuthorsOptions& o) {
        r.integer("limit", &o.limit);
        r.integer("min_papers", &o.min_papers);
        r.string("field_filter", &o.field_filter);
    });
}

core::Result<FieldTrendsOptions> ParseFieldTrendsOptions(const std::string& json) {
    return ParseOptions<FieldTrendsOptions>(json, [](OptionReader& r, FieldTrendsOptions& o) {
        r.string("field", &o.field);
        r.integer("start_year", &o.start_year);
        r.integer("end_year", &o.end_year);
        std::optional<std::string> metric;
        r.string("metric", &metric);
        if (metric) {
            o.metric = ParseTrendMetric(*metric);
        }
    });
}

core::Result<CitationPatternOptions> ParseCitationPatternOptions(const std::string& json) {
    return ParseOptions<CitationPatternOptions>(json, [](OptionReader& r, CitationPatternOptions& o) {
        r.integer("year", &o.year);
        r.string("field", &o.field);
        r.integer("min_citations", &o.min_citations);
    });
}

core::Result<PatentDistributionOptions> ParsePatentDistributionOptions(const std::string& json) {
    return ParseOptions<PatentDistributionOptions>(json, [](OptionReader& r, PatentDistributionOptions& o) {
        r.integer("year", &o.year);
        r.string("field", &o.field);
    });
}

std::string ToJson(const QueryResult& result) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    const auto& columns = result.rows.columns();
    writer.StartObject();
    writer.Key("rows");
    writer.StartArray();
    for (size_t r = 0; r < result.rows.row_count(); ++r) {
        writer.StartObject();
        for (size_t c = 0; c < columns.size(); ++c) {
            WriteString(writer, columns[c]);
            WriteValue(writer, result.rows.at(r, c));
        }
        writer.EndObject();
    }
    writer.EndArray();
    writer.Key("row_count");
    writer.Uint64(result.row_count);
    writer.Key("summary");
    WriteSummary(writer, result.summary);
    writer.EndObject();
    return buffer.GetString();
}

std::string ToJson(const Summary& summary) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    WriteSummary(writer, summary);
    return buffer.GetString();
}

} // namespace query
} // namespace scigraph
