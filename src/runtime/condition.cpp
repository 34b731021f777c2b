#include <tabula/core/schema.hpp>
#include <tabula/runtime/condition.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tabula::runtime {

namespace {

auto compare_numeric(CompareOp op, const Value& lhs, const Value& rhs) -> bool {
    // Two integers compare exactly; anything else goes through double.
    const auto* li = std::get_if<std::int64_t>(&lhs);
    const auto* ri = std::get_if<std::int64_t>(&rhs);
    if (li != nullptr && ri != nullptr) {
        switch (op) {
            case CompareOp::Gt:
                return *li > *ri;
            case CompareOp::Gte:
                return *li >= *ri;
            case CompareOp::Lt:
                return *li < *ri;
            case CompareOp::Lte:
                return *li <= *ri;
            default:
                return false;
        }
    }
    auto l = as_double(lhs);
    auto r = as_double(rhs);
    if (!l || !r) {
        return false;
    }
    switch (op) {
        case CompareOp::Gt:
            return *l > *r;
        case CompareOp::Gte:
            return *l >= *r;
        case CompareOp::Lt:
            return *l < *r;
        case CompareOp::Lte:
            return *l <= *r;
        default:
            return false;
    }
}

auto contains_text(const Value& field, const ConditionValue& needle) -> bool {
    if (is_null(field)) {
        return false;
    }
    const auto* scalar = std::get_if<Value>(&needle);
    if (scalar == nullptr) {
        return false;
    }
    return to_display_string(field).find(to_display_string(*scalar)) != std::string::npos;
}

auto member_of(const Value& field, const ConditionValue& candidates) -> bool {
    if (const auto* scalar = std::get_if<Value>(&candidates)) {
        return loosely_equal(field, *scalar);
    }
    const auto& values = std::get<std::vector<Value>>(candidates);
    return std::ranges::any_of(
        values, [&](const Value& candidate) { return loosely_equal(field, candidate); });
}

}  // namespace

auto loosely_equal(const Value& lhs, const Value& rhs) -> bool {
    if (is_null(lhs) || is_null(rhs)) {
        return is_null(lhs) && is_null(rhs);
    }
    if (is_numeric(lhs) && is_numeric(rhs)) {
        const auto* li = std::get_if<std::int64_t>(&lhs);
        const auto* ri = std::get_if<std::int64_t>(&rhs);
        if (li != nullptr && ri != nullptr) {
            return *li == *ri;
        }
        return *as_double(lhs) == *as_double(rhs);
    }
    if (lhs.index() == rhs.index()) {
        return lhs == rhs;
    }
    return to_display_string(lhs) == to_display_string(rhs);
}

auto matches(const Record& record, const Condition& condition) -> bool {
    const Value& field = record.get(condition.field);
    switch (condition.op) {
        case CompareOp::Eq:
        case CompareOp::Ne: {
            const auto* scalar = std::get_if<Value>(&condition.value);
            if (scalar == nullptr) {
                return false;
            }
            const bool equal = loosely_equal(field, *scalar);
            return condition.op == CompareOp::Eq ? equal : !equal;
        }
        case CompareOp::Gt:
        case CompareOp::Gte:
        case CompareOp::Lt:
        case CompareOp::Lte: {
            const auto* scalar = std::get_if<Value>(&condition.value);
            if (scalar == nullptr) {
                return false;
            }
            return compare_numeric(condition.op, field, *scalar);
        }
        case CompareOp::Contains:
            return contains_text(field, condition.value);
        case CompareOp::In:
            return member_of(field, condition.value);
    }
    return false;
}

auto matches(const Record& record, std::span<const Condition> conditions) -> bool {
    return std::ranges::all_of(
        conditions, [&](const Condition& condition) { return matches(record, condition); });
}

auto filter_table(const Table& input, std::span<const Condition> conditions) -> Table {
    Table output;
    for (const auto& record : input) {
        if (matches(record, conditions)) {
            output.add_record(record);
        }
    }
    return output;
}

auto validate_conditions(const Table& input, std::span<const Condition> conditions)
    -> Expected<void> {
    if (conditions.empty()) {
        return validation_error("filter requires at least one condition");
    }
    for (const auto& condition : conditions) {
        if (condition.field.empty()) {
            return validation_error("filter condition is missing 'field'");
        }
        if (std::holds_alternative<std::vector<Value>>(condition.value) &&
            condition.op != CompareOp::In) {
            return validation_error(
                fmt::format("operator '{}' on field '{}' expects a scalar value, got a sequence",
                            to_string(condition.op), condition.field));
        }
    }
    if (input.empty()) {
        return {};
    }
    auto schema = infer_schema(input);
    for (const auto& condition : conditions) {
        if (!schema.contains(condition.field)) {
            return validation_error(fmt::format("field '{}' not found in data (available: {})",
                                                condition.field, format_columns(schema)));
        }
    }
    return {};
}

}  // namespace tabula::runtime
