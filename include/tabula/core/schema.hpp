#pragma once

#include <tabula/core/record.hpp>
#include <tabula/core/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tabula {

/// Derived description of one column.
struct ColumnInfo {
    std::string name;
    /// Common kind of the non-null values. Int and Double widen to Double;
    /// any other disagreement sets `mixed`.
    ValueKind kind = ValueKind::Null;
    bool mixed = false;
    std::size_t non_null = 0;
    /// Explicit nulls plus records that lack the column.
    std::size_t nulls = 0;

    /// True when every non-null occurrence is numeric and there is at least one.
    [[nodiscard]] auto numeric() const noexcept -> bool {
        return non_null > 0 && !mixed && (kind == ValueKind::Int || kind == ValueKind::Double);
    }
};

/// Column set of a table, in first-seen order.
struct Schema {
    std::vector<ColumnInfo> columns;
    std::unordered_map<std::string, std::size_t> index;

    [[nodiscard]] auto find(const std::string& name) const -> const ColumnInfo*;
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return index.contains(name);
    }
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto numeric_columns() const -> std::vector<std::string>;
};

/// Scan every record once and derive the schema.
[[nodiscard]] auto infer_schema(const Table& table) -> Schema;

/// Comma-separated column list for error messages ("<none>" when empty).
[[nodiscard]] auto format_columns(const Schema& schema) -> std::string;

}  // namespace tabula
