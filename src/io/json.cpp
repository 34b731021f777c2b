#include <tabula/io/json.hpp>

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace tabula::io {

namespace {

auto type_name(const Json& json) -> std::string {
    return json.type_name();
}

/// Member `key` of `object`, or a validation error naming `context`.
auto require(const Json& object, const char* key, std::string_view context)
    -> Expected<const Json*> {
    auto it = object.find(key);
    if (it == object.end()) {
        return validation_error(fmt::format("{} requires '{}'", context, key));
    }
    return &*it;
}

auto decode_string(const Json& json, std::string_view what) -> Expected<std::string> {
    if (!json.is_string()) {
        return validation_error(
            fmt::format("'{}' must be a string, got {}", what, type_name(json)));
    }
    return json.get<std::string>();
}

/// A single name or an array of names.
auto decode_names(const Json& json, std::string_view what) -> Expected<std::vector<std::string>> {
    std::vector<std::string> names;
    if (json.is_string()) {
        names.push_back(json.get<std::string>());
        return names;
    }
    if (!json.is_array()) {
        return validation_error(
            fmt::format("'{}' must be a string or an array of strings", what));
    }
    names.reserve(json.size());
    for (const auto& item : json) {
        auto name = decode_string(item, what);
        if (!name) {
            return std::unexpected(name.error());
        }
        names.push_back(std::move(*name));
    }
    return names;
}

auto decode_statistic(const Json& json, std::string_view what) -> Expected<Statistic> {
    auto text = decode_string(json, what);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto stat = parse_statistic(*text);
    if (!stat) {
        return validation_error(fmt::format("unknown aggregation function '{}'", *text));
    }
    return *stat;
}

auto decode_kind(const Json& json) -> Expected<TransformKind> {
    auto text = decode_string(json, "transformation_type");
    if (!text) {
        return std::unexpected(text.error());
    }
    auto kind = parse_transform_kind(*text);
    if (!kind) {
        return validation_error(fmt::format("unknown transformation type '{}'", *text));
    }
    return *kind;
}

// ─── Parameter decoders ───────────────────────────────────────────────────────

/// {"col": "stat", ...} or [{"column": "col", "function": "stat"}, ...]
auto decode_aggregations(const Json& json) -> Expected<std::vector<AggregationSpec>> {
    std::vector<AggregationSpec> specs;
    if (json.is_object()) {
        for (auto it = json.begin(); it != json.end(); ++it) {
            auto stat = decode_statistic(it.value(), it.key());
            if (!stat) {
                return std::unexpected(stat.error());
            }
            specs.push_back(AggregationSpec{.column = it.key(), .stat = *stat});
        }
        return specs;
    }
    if (!json.is_array()) {
        return validation_error("'aggregations' must be an object or an array");
    }
    for (const auto& item : json) {
        if (!item.is_object()) {
            return validation_error("'aggregations' entries must be objects");
        }
        auto column = require(item, "column", "aggregation entry");
        if (!column) {
            return std::unexpected(column.error());
        }
        auto name = decode_string(**column, "column");
        if (!name) {
            return std::unexpected(name.error());
        }
        const char* stat_key = item.contains("function") ? "function" : "stat";
        auto stat_json = require(item, stat_key, "aggregation entry");
        if (!stat_json) {
            return std::unexpected(stat_json.error());
        }
        auto stat = decode_statistic(**stat_json, *name);
        if (!stat) {
            return std::unexpected(stat.error());
        }
        specs.push_back(AggregationSpec{.column = std::move(*name), .stat = *stat});
    }
    return specs;
}

auto decode_aggregate(const Json& json) -> Expected<Parameters> {
    auto group_by_json = require(json, "group_by", "aggregate");
    if (!group_by_json) {
        return std::unexpected(group_by_json.error());
    }
    auto group_by = decode_names(**group_by_json, "group_by");
    if (!group_by) {
        return std::unexpected(group_by.error());
    }
    AggregateParams params{.group_by = std::move(*group_by), .aggregations = {}};
    if (auto it = json.find("aggregations"); it != json.end() && !it->is_null()) {
        auto aggs = decode_aggregations(*it);
        if (!aggs) {
            return std::unexpected(aggs.error());
        }
        params.aggregations = std::move(*aggs);
    }
    return params;
}

auto decode_condition(const Json& json) -> Expected<Condition> {
    if (!json.is_object()) {
        return validation_error(
            fmt::format("a filter condition must be an object, got {}", type_name(json)));
    }
    auto field_json = require(json, "field", "filter condition");
    if (!field_json) {
        return std::unexpected(field_json.error());
    }
    auto field = decode_string(**field_json, "field");
    if (!field) {
        return std::unexpected(field.error());
    }
    auto op_json = require(json, "operator", "filter condition");
    if (!op_json) {
        return std::unexpected(op_json.error());
    }
    auto op_text = decode_string(**op_json, "operator");
    if (!op_text) {
        return std::unexpected(op_text.error());
    }
    auto op = parse_compare_op(*op_text);
    if (!op) {
        return validation_error(fmt::format("unknown filter operator '{}'", *op_text));
    }

    auto value_json = require(json, "value", "filter condition");
    if (!value_json) {
        return std::unexpected(value_json.error());
    }
    const Json& raw = **value_json;

    Condition condition{.field = std::move(*field), .op = *op, .value = Value{}};
    if (raw.is_array()) {
        std::vector<Value> values;
        values.reserve(raw.size());
        for (const auto& item : raw) {
            auto value = decode_value(item);
            if (!value) {
                return std::unexpected(value.error());
            }
            values.push_back(std::move(*value));
        }
        condition.value = std::move(values);
        return condition;
    }
    auto value = decode_value(raw);
    if (!value) {
        return std::unexpected(value.error());
    }
    condition.value = std::move(*value);
    return condition;
}

auto decode_filter(const Json& json) -> Expected<Parameters> {
    auto conditions_json = require(json, "conditions", "filter");
    if (!conditions_json) {
        return std::unexpected(conditions_json.error());
    }
    FilterParams params;
    const Json& conditions = **conditions_json;
    if (conditions.is_object()) {
        auto condition = decode_condition(conditions);
        if (!condition) {
            return std::unexpected(condition.error());
        }
        params.conditions.push_back(std::move(*condition));
        return params;
    }
    if (!conditions.is_array()) {
        return validation_error("'conditions' must be an object or an array of objects");
    }
    for (const auto& item : conditions) {
        auto condition = decode_condition(item);
        if (!condition) {
            return std::unexpected(condition.error());
        }
        params.conditions.push_back(std::move(*condition));
    }
    return params;
}

auto decode_normalize(const Json& json) -> Expected<Parameters> {
    auto columns_json = require(json, "columns", "normalize");
    if (!columns_json) {
        return std::unexpected(columns_json.error());
    }
    auto columns = decode_names(**columns_json, "columns");
    if (!columns) {
        return std::unexpected(columns.error());
    }
    NormalizeParams params{.columns = std::move(*columns), .method = NormalizeMethod::MinMax};
    if (auto it = json.find("method"); it != json.end()) {
        auto text = decode_string(*it, "method");
        if (!text) {
            return std::unexpected(text.error());
        }
        auto method = parse_normalize_method(*text);
        if (!method) {
            return validation_error(fmt::format("unknown normalization method '{}'", *text));
        }
        params.method = *method;
    }
    return params;
}

auto decode_pivot(const Json& json) -> Expected<Parameters> {
    const char* columns_key = json.contains("columns") ? "columns" : "pivot_columns";
    PivotParams params;
    for (auto [key, target] : {std::pair{"index", &params.index},
                               std::pair{columns_key, &params.pivot_columns},
                               std::pair{"values", &params.values}}) {
        auto member = require(json, key, "pivot");
        if (!member) {
            return validation_error("pivot requires 'index', 'columns' and 'values'");
        }
        auto text = decode_string(**member, key);
        if (!text) {
            return std::unexpected(text.error());
        }
        *target = std::move(*text);
    }
    if (auto it = json.find("aggfunc"); it != json.end()) {
        auto stat = decode_statistic(*it, "aggfunc");
        if (!stat) {
            return std::unexpected(stat.error());
        }
        params.aggfunc = *stat;
    }
    return params;
}

/// Keep two decimals, as the response envelope always has.
auto round_ms(double ms) -> double {
    return std::round(ms * 100.0) / 100.0;
}

auto encode_metadata_value(const MetadataValue& value) -> Json {
    return std::visit([](const auto& v) -> Json { return Json(v); }, value);
}

auto encode_optional(const std::optional<double>& value) -> Json {
    if (!value || !std::isfinite(*value)) {
        return nullptr;
    }
    return *value;
}

}  // namespace

// ─── Decoding ─────────────────────────────────────────────────────────────────

auto decode_value(const Json& json) -> Expected<Value> {
    if (json.is_null()) {
        return Value{};
    }
    if (json.is_boolean()) {
        return Value{json.get<bool>()};
    }
    if (json.is_number_unsigned()) {
        auto u = json.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Value{static_cast<double>(u)};
        }
        return Value{static_cast<std::int64_t>(u)};
    }
    if (json.is_number_integer()) {
        return Value{json.get<std::int64_t>()};
    }
    if (json.is_number_float()) {
        return Value{json.get<double>()};
    }
    if (json.is_string()) {
        return Value{json.get<std::string>()};
    }
    return validation_error(fmt::format("unsupported cell value of type {}", type_name(json)));
}

auto decode_record(const Json& json) -> Expected<Record> {
    if (!json.is_object()) {
        return validation_error(
            fmt::format("a record must be an object, got {}", type_name(json)));
    }
    Record record;
    for (auto it = json.begin(); it != json.end(); ++it) {
        auto value = decode_value(it.value());
        if (!value) {
            return validation_error(
                fmt::format("field '{}': {}", it.key(), value.error().message));
        }
        record.set(it.key(), std::move(*value));
    }
    return record;
}

auto decode_table(const Json& json) -> Expected<Table> {
    if (!json.is_array()) {
        return validation_error(
            fmt::format("'data' must be an array of records, got {}", type_name(json)));
    }
    Table table;
    table.records.reserve(json.size());
    std::size_t row = 0;
    for (const auto& item : json) {
        auto record = decode_record(item);
        if (!record) {
            return validation_error(fmt::format("record {}: {}", row, record.error().message));
        }
        table.add_record(std::move(*record));
        ++row;
    }
    return table;
}

auto decode_parameters(TransformKind kind, const Json& json) -> Expected<Parameters> {
    if (!json.is_object()) {
        return validation_error(
            fmt::format("'parameters' must be an object, got {}", type_name(json)));
    }
    switch (kind) {
        case TransformKind::Aggregate:
            return decode_aggregate(json);
        case TransformKind::Filter:
            return decode_filter(json);
        case TransformKind::Normalize:
            return decode_normalize(json);
        case TransformKind::Pivot:
            return decode_pivot(json);
    }
    return validation_error("unknown transformation type");
}

auto decode_request(const Json& json) -> Expected<TransformationRequest> {
    if (!json.is_object()) {
        return validation_error("a request must be an object");
    }
    auto data_json = require(json, "data", "request");
    if (!data_json) {
        return std::unexpected(data_json.error());
    }
    auto data = decode_table(**data_json);
    if (!data) {
        return std::unexpected(data.error());
    }
    auto kind_json = require(json, "transformation_type", "request");
    if (!kind_json) {
        return std::unexpected(kind_json.error());
    }
    auto kind = decode_kind(**kind_json);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    auto it = json.find("parameters");
    auto params = decode_parameters(*kind, it == json.end() ? Json::object() : *it);
    if (!params) {
        return std::unexpected(params.error());
    }
    return TransformationRequest{.data = std::move(*data), .parameters = std::move(*params)};
}

auto decode_batch(const Json& json) -> Expected<std::vector<TransformationRequest>> {
    const Json* items = &json;
    if (json.is_object()) {
        auto member = require(json, "requests", "batch");
        if (!member) {
            return std::unexpected(member.error());
        }
        items = *member;
    }
    if (!items->is_array()) {
        return validation_error("'requests' must be an array");
    }
    std::vector<TransformationRequest> requests;
    requests.reserve(items->size());
    for (const auto& item : *items) {
        auto request = decode_request(item);
        if (!request) {
            return validation_error(
                fmt::format("request {}: {}", requests.size(), request.error().message));
        }
        requests.push_back(std::move(*request));
    }
    return requests;
}

auto decode_pipeline(const Json& json) -> Expected<PipelineRequest> {
    if (!json.is_object()) {
        return validation_error("a pipeline must be an object");
    }
    auto data_json = require(json, "data", "pipeline");
    if (!data_json) {
        return std::unexpected(data_json.error());
    }
    auto data = decode_table(**data_json);
    if (!data) {
        return std::unexpected(data.error());
    }
    auto steps_json = require(json, "transformations", "pipeline");
    if (!steps_json) {
        return std::unexpected(steps_json.error());
    }
    if (!(*steps_json)->is_array()) {
        return validation_error("'transformations' must be an array");
    }

    PipelineRequest pipeline{.data = std::move(*data), .steps = {}};
    for (const auto& step : **steps_json) {
        const std::size_t number = pipeline.steps.size() + 1;
        if (!step.is_object() || !step.contains("transformation_type")) {
            return validation_error(
                fmt::format("transformation type missing for step {}", number));
        }
        auto kind = decode_kind(step["transformation_type"]);
        if (!kind) {
            return validation_error(fmt::format("step {}: {}", number, kind.error().message));
        }
        auto it = step.find("parameters");
        auto params = decode_parameters(*kind, it == step.end() ? Json::object() : *it);
        if (!params) {
            return validation_error(fmt::format("step {}: {}", number, params.error().message));
        }
        pipeline.steps.push_back(std::move(*params));
    }
    return pipeline;
}

auto parse_json(std::string_view text) -> Expected<Json> {
    auto json = Json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        return validation_error("malformed JSON document");
    }
    return json;
}

// ─── Encoding ─────────────────────────────────────────────────────────────────

auto encode_value(const Value& value) -> Json {
    return std::visit(
        [](const auto& v) -> Json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v))
                    return nullptr;
                return v;
            } else {
                return v;
            }
        },
        value);
}

auto encode_table(const Table& table) -> Json {
    Json rows = Json::array();
    for (const auto& record : table) {
        Json row = Json::object();
        for (const auto& field : record) {
            row[field.name] = encode_value(field.value);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

auto encode_metadata(const Metadata& metadata, const std::vector<ColumnStatistics>& statistics)
    -> Json {
    Json out = Json::object();
    for (const auto& entry : metadata) {
        out[entry.key] = encode_metadata_value(entry.value);
    }
    if (!statistics.empty()) {
        Json stats = Json::object();
        for (const auto& s : statistics) {
            stats[s.column] = Json{
                {"original_mean", encode_optional(s.original_mean)},
                {"original_std", encode_optional(s.original_std)},
                {"normalized_mean", encode_optional(s.normalized_mean)},
                {"normalized_std", encode_optional(s.normalized_std)},
            };
        }
        out["statistics"] = std::move(stats);
    }
    return out;
}

auto encode_result(const TransformationResult& result, TransformKind kind) -> Json {
    Json out = Json::object();
    out["success"] = true;
    out["message"] = fmt::format("Successfully applied {} transformation", to_string(kind));
    out["data"] = encode_table(result.data);
    out["metadata"] = encode_metadata(result.metadata, result.statistics);
    out["processing_time_ms"] = round_ms(result.processing_time_ms);
    return out;
}

auto encode_error(const TransformError& error) -> Json {
    Json out = Json::object();
    out["success"] = false;
    out["message"] = fmt::format("Transformation failed: {}", error.message);
    out["error_kind"] = error.is_client_error() ? "validation" : "computation";
    out["data"] = Json::array();
    out["metadata"] = Json::object();
    out["processing_time_ms"] = 0.0;
    return out;
}

auto encode_batch(const std::vector<TransformationRequest>& requests,
                  const std::vector<runtime::BatchItem>& items) -> Json {
    Json results = Json::array();
    bool all_ok = true;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i]) {
            results.push_back(encode_result(*items[i], requests.at(i).kind()));
        } else {
            all_ok = false;
            results.push_back(encode_error(items[i].error()));
        }
    }
    Json out = Json::object();
    out["success"] = all_ok;
    out["results"] = std::move(results);
    return out;
}

auto encode_pipeline(const runtime::PipelineResult& result) -> Json {
    Json steps = Json::array();
    for (const auto& step : result.steps) {
        Json entry = Json::object();
        entry["step"] = step.step;
        entry["transformation_type"] = std::string(to_string(step.kind));
        entry["metadata"] = encode_metadata(step.metadata);
        entry["processing_time_ms"] = round_ms(step.processing_time_ms);
        steps.push_back(std::move(entry));
    }
    Json out = Json::object();
    out["success"] = true;
    out["message"] =
        fmt::format("Successfully applied {} transformations", result.steps.size());
    out["data"] = encode_table(result.data);
    out["transformation_steps"] = std::move(steps);
    out["processing_time_ms"] = round_ms(result.processing_time_ms);
    return out;
}

auto encode_pipeline_error(const runtime::PipelineError& error) -> Json {
    Json out = Json::object();
    out["success"] = false;
    out["message"] = error.format();
    out["error_kind"] = error.error.is_client_error() ? "validation" : "computation";
    out["step"] = error.step;
    if (error.kind) {
        out["transformation_type"] = std::string(to_string(*error.kind));
    }
    return out;
}

}  // namespace tabula::io
