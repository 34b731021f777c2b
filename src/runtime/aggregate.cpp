#include <tabula/core/schema.hpp>
#include <tabula/core/stats.hpp>
#include <tabula/runtime/aggregate.hpp>
#include <tabula/runtime/group_index.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

namespace tabula::runtime {

namespace {

auto checked_add(std::int64_t a, std::int64_t b) -> std::optional<std::int64_t> {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) {
        return std::nullopt;
    }
    return a + b;
}

auto finite_or_error(double value, Statistic stat, const std::string& column) -> Expected<Value> {
    if (!std::isfinite(value)) {
        return computation_error(fmt::format("{}({}) produced a non-finite result", to_string(stat),
                                             column));
    }
    return Value{value};
}

auto optional_or_null(std::optional<double> value, Statistic stat, const std::string& column)
    -> Expected<Value> {
    if (!value) {
        return Value{};
    }
    return finite_or_error(*value, stat, column);
}

auto dedupe(const std::vector<std::string>& names) -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        if (std::ranges::find(out, name) == out.end()) {
            out.push_back(name);
        }
    }
    return out;
}

}  // namespace

auto reduce(Statistic stat, std::span<const Value> values, const std::string& column)
    -> Expected<Value> {
    if (stat == Statistic::Count) {
        auto n = std::ranges::count_if(values, [](const Value& v) { return !is_null(v); });
        return Value{static_cast<std::int64_t>(n)};
    }

    std::vector<std::int64_t> ints;
    std::vector<double> xs;
    xs.reserve(values.size());
    bool all_int = true;
    for (const auto& value : values) {
        if (const auto* i = std::get_if<std::int64_t>(&value)) {
            ints.push_back(*i);
            xs.push_back(static_cast<double>(*i));
        } else if (const auto* d = std::get_if<double>(&value)) {
            xs.push_back(*d);
            all_int = false;
        }
    }

    switch (stat) {
        case Statistic::Sum: {
            if (all_int) {
                std::int64_t total = 0;
                for (auto i : ints) {
                    auto next = checked_add(total, i);
                    if (!next) {
                        return computation_error(
                            fmt::format("sum({}) overflows a 64-bit integer", column));
                    }
                    total = *next;
                }
                return Value{total};
            }
            return finite_or_error(stats::sum(xs), stat, column);
        }
        case Statistic::Mean:
            return optional_or_null(stats::mean(xs), stat, column);
        case Statistic::Min:
            if (all_int && !ints.empty()) {
                return Value{*std::ranges::min_element(ints)};
            }
            return optional_or_null(stats::minimum(xs), stat, column);
        case Statistic::Max:
            if (all_int && !ints.empty()) {
                return Value{*std::ranges::max_element(ints)};
            }
            return optional_or_null(stats::maximum(xs), stat, column);
        case Statistic::Std:
            return optional_or_null(stats::sample_std(xs), stat, column);
        case Statistic::Count:
            break;
    }
    return computation_error(
        fmt::format("unsupported statistic '{}' on column '{}'", to_string(stat), column));
}

auto aggregation_output_names(const std::vector<std::string>& group_by,
                              const std::vector<AggregationSpec>& aggregations)
    -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(aggregations.size());
    for (const auto& agg : aggregations) {
        auto uses = std::ranges::count(aggregations, agg.column, &AggregationSpec::column);
        const bool is_key = std::ranges::find(group_by, agg.column) != group_by.end();
        if (uses == 1 && !is_key) {
            names.push_back(agg.column);
        } else {
            names.push_back(fmt::format("{}_{}", agg.column, to_string(agg.stat)));
        }
    }
    return names;
}

auto validate_aggregations(const std::vector<AggregationSpec>& aggregations) -> Expected<void> {
    for (std::size_t i = 0; i < aggregations.size(); ++i) {
        const auto& agg = aggregations[i];
        for (std::size_t j = 0; j < i; ++j) {
            if (aggregations[j].column == agg.column && aggregations[j].stat == agg.stat) {
                return validation_error(fmt::format("duplicate aggregation {}({})",
                                                    to_string(agg.stat), agg.column));
            }
        }
    }
    return {};
}

auto aggregate_table(const Table& input, const std::vector<std::string>& group_by,
                     const std::vector<AggregationSpec>& aggregations) -> Expected<Table> {
    if (group_by.empty()) {
        return validation_error("aggregate requires a non-empty 'group_by'");
    }
    if (auto ok = validate_aggregations(aggregations); !ok) {
        return std::unexpected(ok.error());
    }
    const auto keys = dedupe(group_by);

    auto schema = infer_schema(input);
    if (!input.empty()) {
        for (const auto& key : keys) {
            if (!schema.contains(key)) {
                return validation_error(fmt::format("group-by column not found: {} (available: {})",
                                                    key, format_columns(schema)));
            }
        }
        for (const auto& agg : aggregations) {
            if (!schema.contains(agg.column)) {
                return validation_error(
                    fmt::format("aggregate column not found: {} (available: {})", agg.column,
                                format_columns(schema)));
            }
        }
    }

    const auto names = aggregation_output_names(keys, aggregations);
    const std::string count_name =
        std::find(keys.begin(), keys.end(), "count") == keys.end() ? "count" : "row_count";

    GroupIndex groups;
    groups.reserve(input.rows());
    std::vector<std::vector<std::size_t>> members;
    for (std::size_t row = 0; row < input.rows(); ++row) {
        const std::size_t id = groups.intern(make_group_key(input[row], keys));
        if (id == members.size()) {
            members.emplace_back();
        }
        members[id].push_back(row);
    }

    Table output;
    output.records.reserve(members.size());
    std::vector<Value> scratch;
    for (const auto& rows : members) {
        const Record& first = input[rows.front()];
        Record out;
        for (const auto& key : keys) {
            out.set(key, first.get(key));
        }
        if (aggregations.empty()) {
            out.set(count_name, static_cast<std::int64_t>(rows.size()));
        }
        for (std::size_t i = 0; i < aggregations.size(); ++i) {
            const auto& agg = aggregations[i];
            scratch.clear();
            for (auto row : rows) {
                scratch.push_back(input[row].get(agg.column));
            }
            auto reduced = reduce(agg.stat, scratch, agg.column);
            if (!reduced) {
                return std::unexpected(reduced.error());
            }
            out.set(names[i], std::move(*reduced));
        }
        output.add_record(std::move(out));
    }
    return output;
}

}  // namespace tabula::runtime
