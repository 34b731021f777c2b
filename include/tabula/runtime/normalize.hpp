#pragma once

#include <tabula/core/record.hpp>
#include <tabula/runtime/error.hpp>
#include <tabula/runtime/request.hpp>

#include <string>
#include <vector>

namespace tabula::runtime {

struct NormalizeOutput {
    Table table;
    /// Requested columns with duplicates removed, in request order.
    std::vector<std::string> columns;
    std::vector<ColumnStatistics> statistics;
};

/// Rescale `columns` with `method`.
///
/// Statistics are taken per column over all numeric values before any value is
/// rewritten. Rescaled cells become doubles; null and non-numeric cells, every
/// other column and the row count are left as they were. A zero denominator
/// (max == min, zero population std, zero IQR) maps every value to 0.
[[nodiscard]] auto normalize_table(const Table& input, const std::vector<std::string>& columns,
                                   NormalizeMethod method) -> Expected<NormalizeOutput>;

}  // namespace tabula::runtime
