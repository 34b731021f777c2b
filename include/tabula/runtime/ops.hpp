#pragma once

#include <tabula/core/record.hpp>
#include <tabula/runtime/request.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace tabula::ops {

// ─── Core table operations ────────────────────────────────────────────────────
//  Throwing wrappers over runtime::execute. A validation failure raises
//  tabula::ValidationError, a computation failure tabula::ComputationError.

[[nodiscard]] auto filter(const Table& t, std::vector<Condition> conditions) -> Table;

[[nodiscard]] auto aggregate(const Table& t, std::vector<std::string> group_by,
                             std::vector<AggregationSpec> aggregations = {}) -> Table;

[[nodiscard]] auto normalize(const Table& t, std::vector<std::string> columns,
                             NormalizeMethod method = NormalizeMethod::MinMax) -> Table;

[[nodiscard]] auto pivot(const Table& t, std::string index, std::string pivot_columns,
                         std::string values, Statistic aggfunc = Statistic::Sum) -> Table;

/// Full result, metadata included.
[[nodiscard]] auto transform(const TransformationRequest& request) -> TransformationResult;

void print(const Table& t, std::ostream& out = std::cout);

// ─── Builders ─────────────────────────────────────────────────────────────────

[[nodiscard]] auto where(std::string field, CompareOp op, Value value) -> Condition;
[[nodiscard]] auto where_in(std::string field, std::vector<Value> values) -> Condition;
[[nodiscard]] auto make_agg(std::string column, Statistic stat) -> AggregationSpec;

}  // namespace tabula::ops
