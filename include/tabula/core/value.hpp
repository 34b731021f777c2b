#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tabula {

/// Marker for an explicit or implied (missing column) null cell.
using Null = std::monostate;

/// A dynamically typed scalar cell.
///
/// Integers and doubles are both numeric; booleans are not.
using Value = std::variant<Null, bool, std::int64_t, double, std::string>;

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,
    Double,
    String,
};

[[nodiscard]] auto kind_of(const Value& value) noexcept -> ValueKind;

[[nodiscard]] auto kind_name(ValueKind kind) noexcept -> std::string_view;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<Null>(value);
}

[[nodiscard]] inline auto is_numeric(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
}

/// Numeric view of a value; nullopt for null, bool and string.
[[nodiscard]] auto as_double(const Value& value) noexcept -> std::optional<double>;

/// String form used by `contains`, mixed-type equality, pivot column names and printing.
///
/// Integers print in decimal, doubles in shortest round-trip form (30.0 -> "30"),
/// booleans as true/false and null as "null".
[[nodiscard]] auto to_display_string(const Value& value) -> std::string;

/// Canonical form for group keys: doubles holding an exact int64 become integers,
/// so 1 and 1.0 fall into the same bucket.
[[nodiscard]] auto canonicalize(const Value& value) -> Value;

struct ValueHash {
    auto operator()(const Value& value) const noexcept -> std::size_t;
};

}  // namespace tabula
