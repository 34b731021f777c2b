#pragma once
// gen_sales_data: synthetic sales table for benchmarks and examples.
//
// Columns: region (4 values), product (8 values), month (12 values),
// units (int), price (double), rep (string).

#include <tabula/core/record.hpp>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

inline auto gen_sales_data(std::int64_t n) -> tabula::Table {
    if (n < 0)
        throw std::invalid_argument("gen_sales_data: n must be non-negative");
    auto rows = static_cast<std::size_t>(n);

    static constexpr std::array<const char*, 4> kRegions{"north", "south", "east", "west"};
    static constexpr std::array<const char*, 8> kProducts{"anvil",  "bolt",   "crate", "drill",
                                                          "easel",  "funnel", "gear",  "hinge"};

    tabula::Table t;
    t.records.reserve(rows);
    for (std::size_t i = 0; i < rows; ++i) {
        tabula::Record r;
        r.set("region", std::string(kRegions[i % kRegions.size()]));
        r.set("product", std::string(kProducts[(i / 3) % kProducts.size()]));
        r.set("month", static_cast<std::int64_t>(i % 12 + 1));
        r.set("units", static_cast<std::int64_t>((i * 7) % 50));
        r.set("price", 10.0 + static_cast<double>(i % 100) * 0.25);
        r.set("rep", "rep-" + std::to_string(i % 37));
        t.add_record(std::move(r));
    }
    return t;
}
