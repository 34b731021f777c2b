#pragma once

#include <tabula/core/record.hpp>
#include <tabula/runtime/error.hpp>
#include <tabula/runtime/request.hpp>

#include <span>
#include <string>
#include <vector>

namespace tabula::runtime {

/// Reduce one bucket's values for `column` with `stat`.
///
/// count counts non-null values of any kind; every other statistic skips null and
/// non-numeric values. sum of no values is 0; mean/min/max of no values and std of
/// fewer than two values are null. sum/min/max stay integral when every
/// contributing value is an integer. Integer overflow and non-finite results are
/// computation errors naming `column`.
[[nodiscard]] auto reduce(Statistic stat, std::span<const Value> values, const std::string& column)
    -> Expected<Value>;

/// Output column names for `aggregations`: a column aggregated once (and not also a
/// group key) keeps its name, otherwise "<column>_<statistic>".
[[nodiscard]] auto aggregation_output_names(const std::vector<std::string>& group_by,
                                            const std::vector<AggregationSpec>& aggregations)
    -> std::vector<std::string>;

/// Each (column, statistic) pair may appear once; a repeat would collapse two
/// outputs onto one name.
[[nodiscard]] auto validate_aggregations(const std::vector<AggregationSpec>& aggregations)
    -> Expected<void>;

/// Group by `group_by` and reduce each aggregation per bucket, buckets in
/// first-seen order. With no aggregations each bucket gets its row count as "count".
[[nodiscard]] auto aggregate_table(const Table& input, const std::vector<std::string>& group_by,
                                   const std::vector<AggregationSpec>& aggregations)
    -> Expected<Table>;

}  // namespace tabula::runtime
