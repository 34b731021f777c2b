#include <tabula/core/schema.hpp>
#include <tabula/core/stats.hpp>
#include <tabula/runtime/normalize.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace tabula::runtime {

namespace {

/// x -> (x - center) / scale, or 0 when the scale degenerates.
struct Rescale {
    double center = 0.0;
    double scale = 0.0;

    [[nodiscard]] auto finite() const noexcept -> bool {
        return std::isfinite(center) && std::isfinite(scale);
    }

    [[nodiscard]] auto apply(double x) const noexcept -> double {
        if (scale == 0.0) {
            return 0.0;
        }
        return (x - center) / scale;
    }
};

auto numeric_values(const Table& table, const std::string& column) -> std::vector<double> {
    std::vector<double> xs;
    xs.reserve(table.rows());
    for (const auto& record : table) {
        if (auto x = as_double(record.get(column))) {
            xs.push_back(*x);
        }
    }
    return xs;
}

auto fit(NormalizeMethod method, std::span<const double> xs) -> Rescale {
    switch (method) {
        case NormalizeMethod::MinMax: {
            const double lo = *stats::minimum(xs);
            const double hi = *stats::maximum(xs);
            return Rescale{.center = lo, .scale = hi - lo};
        }
        case NormalizeMethod::ZScore:
            return Rescale{.center = *stats::mean(xs), .scale = *stats::population_std(xs)};
        case NormalizeMethod::Robust: {
            const auto q = *stats::quartiles(xs);
            return Rescale{.center = q.median, .scale = q.iqr()};
        }
    }
    return Rescale{};
}

}  // namespace

auto normalize_table(const Table& input, const std::vector<std::string>& columns,
                     NormalizeMethod method) -> Expected<NormalizeOutput> {
    if (columns.empty()) {
        return validation_error("normalize requires a non-empty 'columns'");
    }

    NormalizeOutput out;
    for (const auto& column : columns) {
        if (std::ranges::find(out.columns, column) == out.columns.end()) {
            out.columns.push_back(column);
        }
    }
    out.table = input;
    if (input.empty()) {
        return out;
    }

    auto schema = infer_schema(input);
    std::vector<Rescale> fits;
    std::vector<std::vector<double>> originals;
    fits.reserve(out.columns.size());
    originals.reserve(out.columns.size());
    for (const auto& column : out.columns) {
        if (!schema.contains(column)) {
            return validation_error(fmt::format("normalize column not found: {} (available: {})",
                                                column, format_columns(schema)));
        }
        auto xs = numeric_values(input, column);
        if (xs.empty()) {
            return validation_error(
                fmt::format("normalize column '{}' has no numeric values", column));
        }
        auto rescale = fit(method, xs);
        if (!rescale.finite()) {
            return computation_error(
                fmt::format("{} statistics of column '{}' overflow to a non-finite value",
                            to_string(method), column));
        }
        fits.push_back(rescale);
        originals.push_back(std::move(xs));
    }

    // Second pass: every statistic is fixed before the first rewrite.
    for (std::size_t c = 0; c < out.columns.size(); ++c) {
        const auto& column = out.columns[c];
        const auto& rescale = fits[c];
        std::vector<double> rescaled;
        rescaled.reserve(originals[c].size());
        for (auto& record : out.table.records) {
            Value* cell = record.find(column);
            if (cell == nullptr) {
                continue;
            }
            auto x = as_double(*cell);
            if (!x) {
                continue;
            }
            const double y = rescale.apply(*x);
            if (!std::isfinite(y)) {
                return computation_error(fmt::format(
                    "{} normalization of column '{}' produced a non-finite value",
                    to_string(method), column));
            }
            *cell = y;
            rescaled.push_back(y);
        }
        out.statistics.push_back(ColumnStatistics{.column = column,
                                                  .original_mean = stats::mean(originals[c]),
                                                  .original_std = stats::sample_std(originals[c]),
                                                  .normalized_mean = stats::mean(rescaled),
                                                  .normalized_std = stats::sample_std(rescaled)});
    }
    return out;
}

}  // namespace tabula::runtime
