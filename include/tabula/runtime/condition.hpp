#pragma once

#include <tabula/core/record.hpp>
#include <tabula/runtime/error.hpp>
#include <tabula/runtime/request.hpp>

#include <span>

namespace tabula::runtime {

/// Equality used by eq/ne/in: null equals only null, numerics compare by value,
/// equal kinds compare directly, anything else compares string forms.
[[nodiscard]] auto loosely_equal(const Value& lhs, const Value& rhs) -> bool;

/// Evaluate one condition. A missing field reads as null; never throws on data.
[[nodiscard]] auto matches(const Record& record, const Condition& condition) -> bool;

/// AND of all conditions (true for an empty list).
[[nodiscard]] auto matches(const Record& record, std::span<const Condition> conditions) -> bool;

/// Records satisfying every condition, in input order.
[[nodiscard]] auto filter_table(const Table& input, std::span<const Condition> conditions)
    -> Table;

/// Shape checks: at least one condition, sequence values only with `in`, and every
/// field present in at least one record when `input` is non-empty.
[[nodiscard]] auto validate_conditions(const Table& input, std::span<const Condition> conditions)
    -> Expected<void>;

}  // namespace tabula::runtime
