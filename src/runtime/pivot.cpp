#include <tabula/core/schema.hpp>
#include <tabula/runtime/aggregate.hpp>
#include <tabula/runtime/group_index.hpp>
#include <tabula/runtime/pivot.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <unordered_map>

namespace tabula::runtime {

auto pivot_table(const Table& input, const PivotParams& params) -> Expected<PivotOutput> {
    if (params.index.empty() || params.pivot_columns.empty() || params.values.empty()) {
        return validation_error("pivot requires 'index', 'columns' and 'values'");
    }

    PivotOutput out;
    if (input.empty()) {
        return out;
    }

    auto schema = infer_schema(input);
    for (const auto* name : {&params.index, &params.pivot_columns, &params.values}) {
        if (!schema.contains(*name)) {
            return validation_error(fmt::format("pivot column not found: {} (available: {})",
                                                *name, format_columns(schema)));
        }
    }

    GroupIndex row_ids;
    GroupIndex col_ids;
    GroupIndex cell_ids;
    std::vector<Value> row_values;
    std::vector<std::string> col_names;
    std::unordered_map<std::string, std::size_t> name_owner;
    std::vector<std::array<std::size_t, 2>> cell_pos;
    std::vector<std::vector<Value>> cell_values;

    for (const auto& record : input) {
        const Value& index_value = record.get(params.index);
        const Value& pivot_value = record.get(params.pivot_columns);
        if (is_null(index_value) || is_null(pivot_value)) {
            ++out.skipped_rows;
            continue;
        }

        const std::size_t r = row_ids.intern(GroupKey{{canonicalize(index_value)}});
        if (r == row_values.size()) {
            row_values.push_back(index_value);
        }

        const std::size_t c = col_ids.intern(GroupKey{{canonicalize(pivot_value)}});
        if (c == col_names.size()) {
            auto name = to_display_string(pivot_value);
            if (name == params.index) {
                return validation_error(fmt::format(
                    "pivot value '{}' collides with the index column name", name));
            }
            if (!name_owner.try_emplace(name, c).second) {
                return validation_error(fmt::format(
                    "distinct pivot values map to the same column name '{}'", name));
            }
            col_names.push_back(std::move(name));
        }

        const std::size_t cell = cell_ids.intern(GroupKey{
            {Value{static_cast<std::int64_t>(r)}, Value{static_cast<std::int64_t>(c)}}});
        if (cell == cell_values.size()) {
            cell_values.emplace_back();
            cell_pos.push_back({r, c});
        }
        cell_values[cell].push_back(record.get(params.values));
    }

    std::vector<std::vector<Value>> grid(row_values.size(), std::vector<Value>(col_names.size()));
    for (std::size_t cell = 0; cell < cell_values.size(); ++cell) {
        auto reduced = reduce(params.aggfunc, cell_values[cell], params.values);
        if (!reduced) {
            return std::unexpected(reduced.error());
        }
        const auto [r, c] = cell_pos[cell];
        grid[r][c] = std::move(*reduced);
    }

    out.table.records.reserve(row_values.size());
    for (std::size_t r = 0; r < row_values.size(); ++r) {
        Record row;
        row.set(params.index, row_values[r]);
        for (std::size_t c = 0; c < col_names.size(); ++c) {
            row.set(col_names[c], std::move(grid[r][c]));
        }
        out.table.add_record(std::move(row));
    }
    out.pivot_columns_created = col_names.size();
    return out;
}

}  // namespace tabula::runtime
