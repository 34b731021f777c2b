#include <tabula/core/value.hpp>

#include <fmt/format.h>

#include <cmath>
#include <functional>
#include <limits>
#include <type_traits>

namespace tabula {

auto kind_of(const Value& value) noexcept -> ValueKind {
    switch (value.index()) {
        case 1:
            return ValueKind::Bool;
        case 2:
            return ValueKind::Int;
        case 3:
            return ValueKind::Double;
        case 4:
            return ValueKind::String;
        default:
            return ValueKind::Null;
    }
}

auto kind_name(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Int:
            return "int";
        case ValueKind::Double:
            return "double";
        case ValueKind::String:
            return "string";
    }
    return "unknown";
}

auto as_double(const Value& value) noexcept -> std::optional<double> {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return std::nullopt;
}

auto to_display_string(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{}", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto canonicalize(const Value& value) -> Value {
    if (const auto* d = std::get_if<double>(&value)) {
        // 2^63 is exactly representable; anything at or above it overflows int64.
        constexpr double kInt64Bound = 9223372036854775808.0;
        if (std::isfinite(*d) && std::trunc(*d) == *d && *d >= -kInt64Bound && *d < kInt64Bound) {
            return static_cast<std::int64_t>(*d);
        }
    }
    return value;
}

auto ValueHash::operator()(const Value& value) const noexcept -> std::size_t {
    std::size_t h = std::visit(
        [](const auto& v) -> std::size_t { return std::hash<std::decay_t<decltype(v)>>{}(v); },
        value);
    return h ^ (value.index() * 0x9e3779b97f4a7c15ULL);
}

}  // namespace tabula
