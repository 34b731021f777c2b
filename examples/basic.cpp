#include <tabula/core/schema.hpp>
#include <tabula/runtime/dispatcher.hpp>
#include <tabula/runtime/ops.hpp>

#include <fmt/core.h>

#include <iostream>
#include <string>

auto main() -> int {
    using namespace tabula;
    using namespace std::string_literals;

    // A small sales table
    Table sales{
        Record{{"region", "north"s}, {"product", "anvil"s}, {"units", std::int64_t{12}}},
        Record{{"region", "south"s}, {"product", "anvil"s}, {"units", std::int64_t{7}}},
        Record{{"region", "north"s}, {"product", "bolt"s}, {"units", std::int64_t{30}}},
        Record{{"region", "south"s}, {"product", "bolt"s}, {"units", std::int64_t{4}}},
    };

    fmt::print("=== Schema ===\n");
    auto schema = infer_schema(sales);
    fmt::print("columns: {}\n", format_columns(schema));

    fmt::print("\n=== Filter units >= 7 ===\n");
    ops::print(ops::filter(sales, {ops::where("units", CompareOp::Gte, std::int64_t{7})}));

    fmt::print("\n=== Sum of units by region ===\n");
    ops::print(ops::aggregate(sales, {"region"}, {ops::make_agg("units", Statistic::Sum)}));

    fmt::print("\n=== Pivot region x product ===\n");
    ops::print(ops::pivot(sales, "region", "product", "units"));

    // The dispatcher returns metadata alongside the table
    TransformationRequest request{
        .data = sales,
        .parameters = NormalizeParams{.columns = {"units"}, .method = NormalizeMethod::ZScore}};
    auto result = runtime::execute(request);
    if (!result) {
        fmt::print("error: {}\n", result.error().format());
        return 1;
    }
    fmt::print("\n=== z-score units ({} rows, {:.3f}ms) ===\n", result->data.rows(),
               result->processing_time_ms);
    ops::print(result->data);

    return 0;
}
