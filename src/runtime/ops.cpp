#include <tabula/core/schema.hpp>
#include <tabula/runtime/dispatcher.hpp>
#include <tabula/runtime/ops.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>

namespace tabula::ops {

namespace {

auto delegate(Table data, Parameters params) -> TransformationResult {
    // All convenience ops route through the dispatcher so they share its
    // validation and metadata handling.
    TransformationRequest request{.data = std::move(data), .parameters = std::move(params)};
    auto result = runtime::execute(request);
    if (!result) {
        throw_error(result.error());
    }
    return std::move(*result);
}

}  // namespace

// ─── Core ops ─────────────────────────────────────────────────────────────────

auto filter(const Table& t, std::vector<Condition> conditions) -> Table {
    return delegate(t, FilterParams{.conditions = std::move(conditions)}).data;
}

auto aggregate(const Table& t, std::vector<std::string> group_by,
               std::vector<AggregationSpec> aggregations) -> Table {
    return delegate(t, AggregateParams{.group_by = std::move(group_by),
                                       .aggregations = std::move(aggregations)})
        .data;
}

auto normalize(const Table& t, std::vector<std::string> columns, NormalizeMethod method)
    -> Table {
    return delegate(t, NormalizeParams{.columns = std::move(columns), .method = method}).data;
}

auto pivot(const Table& t, std::string index, std::string pivot_columns, std::string values,
           Statistic aggfunc) -> Table {
    return delegate(t, PivotParams{.index = std::move(index),
                                   .pivot_columns = std::move(pivot_columns),
                                   .values = std::move(values),
                                   .aggfunc = aggfunc})
        .data;
}

auto transform(const TransformationRequest& request) -> TransformationResult {
    return delegate(request.data, request.parameters);
}

void print(const Table& t, std::ostream& out) {
    const auto names = infer_schema(t).names();
    if (names.empty()) {
        out << "(empty table)\n";
        return;
    }

    // Row-major text grid: header first, then one line per record.
    std::vector<std::vector<std::string>> grid;
    grid.reserve(t.rows() + 1);
    grid.push_back(names);
    for (const auto& record : t) {
        auto& line = grid.emplace_back();
        line.reserve(names.size());
        for (const auto& name : names) {
            line.push_back(to_display_string(record.get(name)));
        }
    }

    std::vector<std::size_t> widths(names.size(), 0);
    for (const auto& line : grid) {
        for (std::size_t c = 0; c < line.size(); ++c) {
            widths[c] = std::max(widths[c], line[c].size());
        }
    }

    auto emit = [&](const std::vector<std::string>& line) {
        std::string text;
        for (std::size_t c = 0; c < line.size(); ++c) {
            fmt::format_to(std::back_inserter(text), "{}{:<{}}", c == 0 ? "" : "  ", line[c],
                           widths[c]);
        }
        out << text << '\n';
    };

    emit(grid.front());
    std::vector<std::string> rule;
    rule.reserve(widths.size());
    for (auto w : widths) {
        rule.emplace_back(w, '-');
    }
    emit(rule);
    std::for_each(grid.begin() + 1, grid.end(), emit);
}

// ─── Builders ─────────────────────────────────────────────────────────────────

auto where(std::string field, CompareOp op, Value value) -> Condition {
    return Condition{.field = std::move(field), .op = op, .value = std::move(value)};
}

auto where_in(std::string field, std::vector<Value> values) -> Condition {
    return Condition{.field = std::move(field), .op = CompareOp::In, .value = std::move(values)};
}

auto make_agg(std::string column, Statistic stat) -> AggregationSpec {
    return AggregationSpec{.column = std::move(column), .stat = stat};
}

}  // namespace tabula::ops
