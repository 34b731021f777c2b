#include <tabula/core/stats.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace tabula::stats {

namespace {

auto sorted_copy(std::span<const double> xs) -> std::vector<double> {
    std::vector<double> out(xs.begin(), xs.end());
    std::ranges::sort(out);
    return out;
}

auto quantile_sorted(const std::vector<double>& sorted, double q) -> double {
    q = std::clamp(q, 0.0, 1.0);
    const double pos = q * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(pos));
    const auto hi = static_cast<std::size_t>(std::ceil(pos));
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

}  // namespace

auto sum(std::span<const double> xs) noexcept -> double {
    double total = 0.0;
    double compensation = 0.0;
    for (double x : xs) {
        double t = total + x;
        if (std::fabs(total) >= std::fabs(x)) {
            compensation += (total - t) + x;
        } else {
            compensation += (x - t) + total;
        }
        total = t;
    }
    return total + compensation;
}

auto mean(std::span<const double> xs) noexcept -> std::optional<double> {
    if (xs.empty()) {
        return std::nullopt;
    }
    return sum(xs) / static_cast<double>(xs.size());
}

auto variance(std::span<const double> xs, std::size_t ddof) noexcept -> std::optional<double> {
    if (xs.size() <= ddof) {
        return std::nullopt;
    }
    const double mu = sum(xs) / static_cast<double>(xs.size());
    double squares = 0.0;
    double residual = 0.0;
    for (double x : xs) {
        const double d = x - mu;
        squares += d * d;
        residual += d;
    }
    // Corrected two-pass: subtract the rounding error left in the mean.
    squares -= residual * residual / static_cast<double>(xs.size());
    return std::max(0.0, squares / static_cast<double>(xs.size() - ddof));
}

auto sample_std(std::span<const double> xs) noexcept -> std::optional<double> {
    auto var = variance(xs, 1);
    if (!var) {
        return std::nullopt;
    }
    return std::sqrt(*var);
}

auto population_std(std::span<const double> xs) noexcept -> std::optional<double> {
    auto var = variance(xs, 0);
    if (!var) {
        return std::nullopt;
    }
    return std::sqrt(*var);
}

auto minimum(std::span<const double> xs) noexcept -> std::optional<double> {
    if (xs.empty()) {
        return std::nullopt;
    }
    return *std::ranges::min_element(xs);
}

auto maximum(std::span<const double> xs) noexcept -> std::optional<double> {
    if (xs.empty()) {
        return std::nullopt;
    }
    return *std::ranges::max_element(xs);
}

auto quantile(std::span<const double> xs, double q) -> std::optional<double> {
    if (xs.empty()) {
        return std::nullopt;
    }
    return quantile_sorted(sorted_copy(xs), q);
}

auto median(std::span<const double> xs) -> std::optional<double> {
    return quantile(xs, 0.5);
}

auto quartiles(std::span<const double> xs) -> std::optional<Quartiles> {
    if (xs.empty()) {
        return std::nullopt;
    }
    auto sorted = sorted_copy(xs);
    return Quartiles{.q1 = quantile_sorted(sorted, 0.25),
                     .median = quantile_sorted(sorted, 0.5),
                     .q3 = quantile_sorted(sorted, 0.75)};
}

}  // namespace tabula::stats
