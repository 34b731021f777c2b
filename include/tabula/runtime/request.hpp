#pragma once

#include <tabula/core/record.hpp>
#include <tabula/core/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabula {

// ─── Tags ─────────────────────────────────────────────────────────────────────

enum class TransformKind : std::uint8_t {
    Aggregate,
    Filter,
    Normalize,
    Pivot,
};

/// Named reductions shared by aggregate and pivot.
enum class Statistic : std::uint8_t {
    Sum,
    Mean,
    Count,
    Min,
    Max,
    Std,
};

/// Filter operators.
enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Gt,
    Gte,
    Lt,
    Lte,
    Contains,
    In,
};

enum class NormalizeMethod : std::uint8_t {
    MinMax,
    ZScore,
    Robust,
};

[[nodiscard]] auto to_string(TransformKind kind) noexcept -> std::string_view;
[[nodiscard]] auto to_string(Statistic stat) noexcept -> std::string_view;
[[nodiscard]] auto to_string(CompareOp op) noexcept -> std::string_view;
[[nodiscard]] auto to_string(NormalizeMethod method) noexcept -> std::string_view;

[[nodiscard]] auto parse_transform_kind(std::string_view text) noexcept
    -> std::optional<TransformKind>;
[[nodiscard]] auto parse_statistic(std::string_view text) noexcept -> std::optional<Statistic>;
[[nodiscard]] auto parse_compare_op(std::string_view text) noexcept -> std::optional<CompareOp>;
[[nodiscard]] auto parse_normalize_method(std::string_view text) noexcept
    -> std::optional<NormalizeMethod>;

// ─── Parameters ───────────────────────────────────────────────────────────────

struct AggregationSpec {
    std::string column;
    Statistic stat = Statistic::Sum;
};

struct AggregateParams {
    std::vector<std::string> group_by;
    /// Ordered column -> statistic pairs. Empty means "row count per group".
    std::vector<AggregationSpec> aggregations;
};

/// Right-hand side of a condition: a scalar, or a sequence for `in`.
using ConditionValue = std::variant<Value, std::vector<Value>>;

struct Condition {
    std::string field;
    CompareOp op = CompareOp::Eq;
    ConditionValue value;
};

struct FilterParams {
    /// Combined with AND.
    std::vector<Condition> conditions;
};

struct NormalizeParams {
    std::vector<std::string> columns;
    NormalizeMethod method = NormalizeMethod::MinMax;
};

struct PivotParams {
    std::string index;
    std::string pivot_columns;
    std::string values;
    Statistic aggfunc = Statistic::Sum;
};

/// The alternative held is the transformation type.
using Parameters = std::variant<AggregateParams, FilterParams, NormalizeParams, PivotParams>;

[[nodiscard]] auto transform_kind(const Parameters& params) noexcept -> TransformKind;

struct TransformationRequest {
    Table data;
    Parameters parameters;

    [[nodiscard]] auto kind() const noexcept -> TransformKind {
        return transform_kind(parameters);
    }
};

// ─── Result ───────────────────────────────────────────────────────────────────

using MetadataValue = std::variant<std::int64_t, double, std::string, std::vector<std::string>>;

struct MetadataEntry {
    std::string key;
    MetadataValue value;
};

/// Ordered descriptive entries attached to a result.
class Metadata {
   public:
    using const_iterator = std::vector<MetadataEntry>::const_iterator;

    void set(std::string key, MetadataValue value);
    void set_count(std::string key, std::size_t count) {
        set(std::move(key), static_cast<std::int64_t>(count));
    }

    [[nodiscard]] auto find(std::string_view key) const -> const MetadataValue*;
    [[nodiscard]] auto contains(std::string_view key) const -> bool { return find(key) != nullptr; }

    [[nodiscard]] auto get_int(std::string_view key) const -> std::optional<std::int64_t>;
    [[nodiscard]] auto get_double(std::string_view key) const -> std::optional<double>;
    [[nodiscard]] auto get_string(std::string_view key) const -> std::optional<std::string>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    [[nodiscard]] auto begin() const noexcept -> const_iterator { return entries_.cbegin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return entries_.cend(); }

   private:
    std::vector<MetadataEntry> entries_;
};

/// Before/after moments of one normalized column. Std is the sample std.
struct ColumnStatistics {
    std::string column;
    std::optional<double> original_mean;
    std::optional<double> original_std;
    std::optional<double> normalized_mean;
    std::optional<double> normalized_std;
};

struct TransformationResult {
    Table data;
    Metadata metadata;
    /// Filled by normalize only.
    std::vector<ColumnStatistics> statistics;
    double processing_time_ms = 0.0;
};

}  // namespace tabula
