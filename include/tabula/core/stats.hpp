#pragma once

#include <cstddef>
#include <optional>
#include <span>

namespace tabula::stats {

// ─── Reducers ─────────────────────────────────────────────────────────────────
//  Pure functions over numeric samples, shared by aggregate, pivot and normalize.
//  Every reducer that has no defined value for its input returns nullopt.

/// Compensated (Neumaier) sum. Empty input sums to 0.
[[nodiscard]] auto sum(std::span<const double> xs) noexcept -> double;

[[nodiscard]] auto mean(std::span<const double> xs) noexcept -> std::optional<double>;

/// Two-pass variance with `ddof` delta degrees of freedom (0 = population, 1 = sample).
/// Needs more than `ddof` values.
[[nodiscard]] auto variance(std::span<const double> xs, std::size_t ddof) noexcept
    -> std::optional<double>;

/// Standard deviation dividing by n - 1; needs at least 2 values.
[[nodiscard]] auto sample_std(std::span<const double> xs) noexcept -> std::optional<double>;

/// Standard deviation dividing by n; needs at least 1 value.
[[nodiscard]] auto population_std(std::span<const double> xs) noexcept -> std::optional<double>;

[[nodiscard]] auto minimum(std::span<const double> xs) noexcept -> std::optional<double>;
[[nodiscard]] auto maximum(std::span<const double> xs) noexcept -> std::optional<double>;

/// Quantile with linear interpolation between closest ranks (position q * (n - 1)
/// in sorted order). `q` is clamped to [0, 1].
[[nodiscard]] auto quantile(std::span<const double> xs, double q) -> std::optional<double>;

[[nodiscard]] auto median(std::span<const double> xs) -> std::optional<double>;

struct Quartiles {
    double q1 = 0.0;
    double median = 0.0;
    double q3 = 0.0;

    [[nodiscard]] auto iqr() const noexcept -> double { return q3 - q1; }
};

/// Q1, median and Q3 from a single sort.
[[nodiscard]] auto quartiles(std::span<const double> xs) -> std::optional<Quartiles>;

}  // namespace tabula::stats
