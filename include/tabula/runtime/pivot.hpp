#pragma once

#include <tabula/core/record.hpp>
#include <tabula/runtime/error.hpp>
#include <tabula/runtime/request.hpp>

#include <cstddef>

namespace tabula::runtime {

struct PivotOutput {
    Table table;
    std::size_t pivot_columns_created = 0;
    /// Records dropped because their index or pivot value was null.
    std::size_t skipped_rows = 0;
};

/// Spread `params.pivot_columns` values into columns, one row per `params.index` value.
///
/// Each (index, pivot) bucket's `params.values` are reduced with `params.aggfunc`
/// (see reduce()). Columns are the index column followed by pivot values in
/// first-seen order, named by their string form; rows follow first-seen index
/// order; combinations that never occur are null.
[[nodiscard]] auto pivot_table(const Table& input, const PivotParams& params)
    -> Expected<PivotOutput>;

}  // namespace tabula::runtime
