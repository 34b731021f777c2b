#include <tabula/runtime/aggregate.hpp>
#include <tabula/runtime/condition.hpp>
#include <tabula/runtime/dispatcher.hpp>
#include <tabula/runtime/normalize.hpp>
#include <tabula/runtime/pivot.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace tabula::runtime {

namespace {

using Clock = std::chrono::steady_clock;

auto elapsed_ms(Clock::time_point start) -> double {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

auto require_names(const std::vector<std::string>& names, std::string_view what)
    -> Expected<void> {
    for (const auto& name : names) {
        if (name.empty()) {
            return validation_error(fmt::format("'{}' contains an empty column name", what));
        }
    }
    return {};
}

// ─── Shape validation ─────────────────────────────────────────────────────────

auto validate_params(const Table& /*data*/, const AggregateParams& params) -> Expected<void> {
    if (params.group_by.empty()) {
        return validation_error("aggregate requires a non-empty 'group_by'");
    }
    if (auto ok = require_names(params.group_by, "group_by"); !ok) {
        return ok;
    }
    for (const auto& agg : params.aggregations) {
        if (agg.column.empty()) {
            return validation_error("'aggregations' contains an empty column name");
        }
    }
    return validate_aggregations(params.aggregations);
}

auto validate_params(const Table& data, const FilterParams& params) -> Expected<void> {
    return validate_conditions(data, params.conditions);
}

auto validate_params(const Table& /*data*/, const NormalizeParams& params) -> Expected<void> {
    if (params.columns.empty()) {
        return validation_error("normalize requires a non-empty 'columns'");
    }
    return require_names(params.columns, "columns");
}

auto validate_params(const Table& /*data*/, const PivotParams& params) -> Expected<void> {
    if (params.index.empty() || params.pivot_columns.empty() || params.values.empty()) {
        return validation_error("pivot requires 'index', 'columns' and 'values'");
    }
    return {};
}

// ─── Component runs ───────────────────────────────────────────────────────────

auto run(const Table& data, const AggregateParams& params) -> Expected<TransformationResult> {
    auto start = Clock::now();
    auto table = aggregate_table(data, params.group_by, params.aggregations);
    const double ms = elapsed_ms(start);
    if (!table) {
        return std::unexpected(table.error());
    }

    std::vector<std::string> functions;
    functions.reserve(params.aggregations.size());
    for (const auto& agg : params.aggregations) {
        functions.push_back(fmt::format("{}:{}", agg.column, to_string(agg.stat)));
    }
    if (functions.empty()) {
        functions.emplace_back("count");
    }

    TransformationResult result;
    result.processing_time_ms = ms;
    result.metadata.set_count("original_rows", data.rows());
    result.metadata.set_count("transformed_rows", table->rows());
    result.metadata.set_count("groups_created", table->rows());
    result.metadata.set("group_by_columns", params.group_by);
    result.metadata.set("aggregation_functions", std::move(functions));
    result.data = std::move(*table);
    return result;
}

auto run(const Table& data, const FilterParams& params) -> Expected<TransformationResult> {
    auto start = Clock::now();
    auto table = filter_table(data, params.conditions);
    const double ms = elapsed_ms(start);

    TransformationResult result;
    result.processing_time_ms = ms;
    result.metadata.set_count("original_rows", data.rows());
    result.metadata.set_count("filtered_rows", table.rows());
    result.metadata.set_count("transformed_rows", table.rows());
    result.metadata.set_count("conditions_applied", params.conditions.size());
    result.metadata.set("filter_ratio", data.empty() ? 0.0
                                                     : static_cast<double>(table.rows()) /
                                                           static_cast<double>(data.rows()));
    result.data = std::move(table);
    return result;
}

auto run(const Table& data, const NormalizeParams& params) -> Expected<TransformationResult> {
    auto start = Clock::now();
    auto normalized = normalize_table(data, params.columns, params.method);
    const double ms = elapsed_ms(start);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    TransformationResult result;
    result.processing_time_ms = ms;
    result.metadata.set_count("original_rows", data.rows());
    result.metadata.set_count("transformed_rows", normalized->table.rows());
    result.metadata.set_count("columns_normalized", normalized->columns.size());
    result.metadata.set("normalized_columns", normalized->columns);
    result.metadata.set("normalization_method", std::string(to_string(params.method)));
    result.statistics = std::move(normalized->statistics);
    result.data = std::move(normalized->table);
    return result;
}

auto run(const Table& data, const PivotParams& params) -> Expected<TransformationResult> {
    auto start = Clock::now();
    auto pivoted = pivot_table(data, params);
    const double ms = elapsed_ms(start);
    if (!pivoted) {
        return std::unexpected(pivoted.error());
    }

    TransformationResult result;
    result.processing_time_ms = ms;
    result.metadata.set_count("original_rows", data.rows());
    result.metadata.set_count("pivoted_rows", pivoted->table.rows());
    result.metadata.set_count("transformed_rows", pivoted->table.rows());
    result.metadata.set("index_column", params.index);
    result.metadata.set("pivot_columns", params.pivot_columns);
    result.metadata.set("values_column", params.values);
    result.metadata.set("aggregation_function", std::string(to_string(params.aggfunc)));
    result.metadata.set_count("pivot_columns_created", pivoted->pivot_columns_created);
    result.metadata.set_count("skipped_rows", pivoted->skipped_rows);
    result.data = std::move(pivoted->table);
    return result;
}

/// Envelope for an empty input table: every counter is zero.
auto empty_result(TransformKind kind) -> TransformationResult {
    TransformationResult result;
    result.metadata.set_count("original_rows", 0);
    result.metadata.set_count("transformed_rows", 0);
    switch (kind) {
        case TransformKind::Aggregate:
            result.metadata.set_count("groups_created", 0);
            break;
        case TransformKind::Filter:
            result.metadata.set_count("filtered_rows", 0);
            break;
        case TransformKind::Normalize:
            result.metadata.set_count("columns_normalized", 0);
            break;
        case TransformKind::Pivot:
            result.metadata.set_count("pivoted_rows", 0);
            break;
    }
    return result;
}

}  // namespace

auto validate(const TransformationRequest& request) -> Expected<void> {
    return std::visit([&](const auto& params) { return validate_params(request.data, params); },
                      request.parameters);
}

auto execute(const TransformationRequest& request) -> Expected<TransformationResult> {
    const auto kind = request.kind();
    if (auto ok = validate(request); !ok) {
        spdlog::debug("{} request rejected: {}", to_string(kind), ok.error().message);
        return std::unexpected(ok.error());
    }
    if (request.data.empty()) {
        spdlog::debug("{} on empty table: returning empty result", to_string(kind));
        return empty_result(kind);
    }

    spdlog::debug("processing {} transformation for {} records", to_string(kind),
                  request.data.rows());
    auto result = std::visit([&](const auto& params) { return run(request.data, params); },
                             request.parameters);
    if (!result) {
        spdlog::debug("{} transformation failed: {}", to_string(kind), result.error().format());
        return result;
    }
    spdlog::debug("{} transformation completed in {:.2f}ms: {} -> {} records", to_string(kind),
                  result->processing_time_ms, request.data.rows(), result->data.rows());
    return result;
}

}  // namespace tabula::runtime
