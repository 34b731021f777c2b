#include <tabula/runtime/request.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace tabula {

namespace {

template <typename Enum, std::size_t N>
auto lookup(const std::array<std::pair<std::string_view, Enum>, N>& table,
            std::string_view text) noexcept -> std::optional<Enum> {
    for (const auto& [name, value] : table) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

template <typename Enum, std::size_t N>
auto name_of(const std::array<std::pair<std::string_view, Enum>, N>& table, Enum value) noexcept
    -> std::string_view {
    for (const auto& [name, candidate] : table) {
        if (candidate == value) {
            return name;
        }
    }
    return "unknown";
}

constexpr std::array<std::pair<std::string_view, TransformKind>, 4> kTransformKinds{{
    {"aggregate", TransformKind::Aggregate},
    {"filter", TransformKind::Filter},
    {"normalize", TransformKind::Normalize},
    {"pivot", TransformKind::Pivot},
}};

constexpr std::array<std::pair<std::string_view, Statistic>, 6> kStatistics{{
    {"sum", Statistic::Sum},
    {"mean", Statistic::Mean},
    {"count", Statistic::Count},
    {"min", Statistic::Min},
    {"max", Statistic::Max},
    {"std", Statistic::Std},
}};

constexpr std::array<std::pair<std::string_view, CompareOp>, 8> kCompareOps{{
    {"eq", CompareOp::Eq},
    {"ne", CompareOp::Ne},
    {"gt", CompareOp::Gt},
    {"gte", CompareOp::Gte},
    {"lt", CompareOp::Lt},
    {"lte", CompareOp::Lte},
    {"contains", CompareOp::Contains},
    {"in", CompareOp::In},
}};

constexpr std::array<std::pair<std::string_view, NormalizeMethod>, 3> kNormalizeMethods{{
    {"min_max", NormalizeMethod::MinMax},
    {"z_score", NormalizeMethod::ZScore},
    {"robust", NormalizeMethod::Robust},
}};

}  // namespace

auto to_string(TransformKind kind) noexcept -> std::string_view {
    return name_of(kTransformKinds, kind);
}

auto to_string(Statistic stat) noexcept -> std::string_view {
    return name_of(kStatistics, stat);
}

auto to_string(CompareOp op) noexcept -> std::string_view {
    return name_of(kCompareOps, op);
}

auto to_string(NormalizeMethod method) noexcept -> std::string_view {
    return name_of(kNormalizeMethods, method);
}

auto parse_transform_kind(std::string_view text) noexcept -> std::optional<TransformKind> {
    return lookup(kTransformKinds, text);
}

auto parse_statistic(std::string_view text) noexcept -> std::optional<Statistic> {
    return lookup(kStatistics, text);
}

auto parse_compare_op(std::string_view text) noexcept -> std::optional<CompareOp> {
    return lookup(kCompareOps, text);
}

auto parse_normalize_method(std::string_view text) noexcept -> std::optional<NormalizeMethod> {
    return lookup(kNormalizeMethods, text);
}

auto transform_kind(const Parameters& params) noexcept -> TransformKind {
    switch (params.index()) {
        case 0:
            return TransformKind::Aggregate;
        case 1:
            return TransformKind::Filter;
        case 2:
            return TransformKind::Normalize;
        default:
            return TransformKind::Pivot;
    }
}

// ─── Metadata ─────────────────────────────────────────────────────────────────

void Metadata::set(std::string key, MetadataValue value) {
    auto it = std::ranges::find_if(entries_,
                                   [&](const MetadataEntry& entry) { return entry.key == key; });
    if (it != entries_.end()) {
        it->value = std::move(value);
        return;
    }
    entries_.push_back(MetadataEntry{.key = std::move(key), .value = std::move(value)});
}

auto Metadata::find(std::string_view key) const -> const MetadataValue* {
    auto it = std::ranges::find_if(entries_,
                                   [key](const MetadataEntry& entry) { return entry.key == key; });
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->value;
}

auto Metadata::get_int(std::string_view key) const -> std::optional<std::int64_t> {
    const auto* value = find(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<std::int64_t>(value)) {
        return *i;
    }
    return std::nullopt;
}

auto Metadata::get_double(std::string_view key) const -> std::optional<double> {
    const auto* value = find(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* d = std::get_if<double>(value)) {
        return *d;
    }
    if (const auto* i = std::get_if<std::int64_t>(value)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

auto Metadata::get_string(std::string_view key) const -> std::optional<std::string> {
    const auto* value = find(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        return *s;
    }
    return std::nullopt;
}

}  // namespace tabula
