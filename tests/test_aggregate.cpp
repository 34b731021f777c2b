#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <tabula/runtime/aggregate.hpp>
#include <tabula/runtime/ops.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace std::string_literals;
using tabula::AggregationSpec;
using tabula::Record;
using tabula::Statistic;
using tabula::Table;
using tabula::Value;
using tabula::ops::make_agg;

namespace {

auto region_sales() -> Table {
    return Table{
        Record{{"region", "North"s}, {"sales", std::int64_t{100}}},
        Record{{"region", "North"s}, {"sales", std::int64_t{150}}},
        Record{{"region", "South"s}, {"sales", std::int64_t{200}}},
        Record{{"region", "South"s}, {"sales", std::int64_t{120}}},
    };
}

auto int_value(std::int64_t v) -> Value {
    return Value{v};
}

}  // namespace

TEST_CASE("Aggregate - sum by region") {
    auto out = tabula::runtime::aggregate_table(region_sales(), {"region"},
                                                {make_agg("sales", Statistic::Sum)});
    REQUIRE(out.has_value());
    Table expected{
        Record{{"region", "North"s}, {"sales", std::int64_t{250}}},
        Record{{"region", "South"s}, {"sales", std::int64_t{320}}},
    };
    REQUIRE(*out == expected);
}

TEST_CASE("Aggregate - buckets follow first-seen order") {
    Table t{
        Record{{"k", "b"s}, {"v", std::int64_t{1}}},
        Record{{"k", "a"s}, {"v", std::int64_t{2}}},
        Record{{"k", "b"s}, {"v", std::int64_t{3}}},
    };
    auto out = tabula::runtime::aggregate_table(t, {"k"}, {make_agg("v", Statistic::Sum)});
    REQUIRE(out.has_value());
    REQUIRE(out->rows() == 2);
    REQUIRE((*out)[0].get("k") == Value{"b"s});
    REQUIRE((*out)[0].get("v") == int_value(4));
    REQUIRE((*out)[1].get("k") == Value{"a"s});
}

TEST_CASE("Aggregate - every statistic on one bucket") {
    Table t{
        Record{{"g", "x"s}, {"v", std::int64_t{2}}},
        Record{{"g", "x"s}, {"v", std::int64_t{4}}},
        Record{{"g", "x"s}, {"v", std::int64_t{9}}},
    };
    std::vector<AggregationSpec> aggs{
        make_agg("v", Statistic::Sum),  make_agg("v", Statistic::Mean),
        make_agg("v", Statistic::Count), make_agg("v", Statistic::Min),
        make_agg("v", Statistic::Max),  make_agg("v", Statistic::Std),
    };
    auto out = tabula::runtime::aggregate_table(t, {"g"}, aggs);
    REQUIRE(out.has_value());
    const Record& row = (*out)[0];
    REQUIRE(row.get("v_sum") == int_value(15));
    REQUIRE(std::get<double>(row.get("v_mean")) == Catch::Approx(5.0));
    REQUIRE(row.get("v_count") == int_value(3));
    REQUIRE(row.get("v_min") == int_value(2));
    REQUIRE(row.get("v_max") == int_value(9));
    REQUIRE(std::get<double>(row.get("v_std")) == Catch::Approx(std::sqrt(13.0)));
}

TEST_CASE("Aggregate - output naming") {
    std::vector<AggregationSpec> aggs{
        make_agg("price", Statistic::Mean),
        make_agg("qty", Statistic::Sum),
        make_agg("qty", Statistic::Max),
        make_agg("region", Statistic::Count),
    };
    auto names = tabula::runtime::aggregation_output_names({"region"}, aggs);
    const std::vector<std::string> expected{"price", "qty_sum", "qty_max", "region_count"};
    REQUIRE(names == expected);
}

TEST_CASE("Aggregate - no aggregations counts rows per group") {
    auto out = tabula::runtime::aggregate_table(region_sales(), {"region"}, {});
    REQUIRE(out.has_value());
    REQUIRE(out->rows() == 2);
    REQUIRE((*out)[0].get("count") == int_value(2));
    REQUIRE((*out)[1].get("count") == int_value(2));
}

TEST_CASE("Aggregate - count equals non-null contributing values") {
    Table t{
        Record{{"g", "a"s}, {"v", std::int64_t{1}}},
        Record{{"g", "a"s}, {"v", Value{}}},
        Record{{"g", "a"s}, {"v", "text"s}},
        Record{{"g", "b"s}},
        Record{{"g", "b"s}, {"v", 2.5}},
    };
    auto out = tabula::runtime::aggregate_table(t, {"g"}, {make_agg("v", Statistic::Count)});
    REQUIRE(out.has_value());
    REQUIRE((*out)[0].get("v") == int_value(2));
    REQUIRE((*out)[1].get("v") == int_value(1));
}

TEST_CASE("Aggregate - integral doubles share a bucket with integers") {
    Table t{
        Record{{"k", std::int64_t{1}}, {"v", std::int64_t{10}}},
        Record{{"k", 1.0}, {"v", std::int64_t{5}}},
        Record{{"k", 1.5}, {"v", std::int64_t{1}}},
    };
    auto out = tabula::runtime::aggregate_table(t, {"k"}, {make_agg("v", Statistic::Sum)});
    REQUIRE(out.has_value());
    REQUIRE(out->rows() == 2);
    REQUIRE((*out)[0].get("k") == int_value(1));
    REQUIRE((*out)[0].get("v") == int_value(15));
}

TEST_CASE("Aggregate - missing group column becomes a null key") {
    Table t{
        Record{{"k", "a"s}, {"v", std::int64_t{1}}},
        Record{{"v", std::int64_t{2}}},
        Record{{"k", Value{}}, {"v", std::int64_t{3}}},
    };
    auto out = tabula::runtime::aggregate_table(t, {"k"}, {make_agg("v", Statistic::Sum)});
    REQUIRE(out.has_value());
    REQUIRE(out->rows() == 2);
    REQUIRE(tabula::is_null((*out)[1].get("k")));
    REQUIRE((*out)[1].get("v") == int_value(5));
}

TEST_CASE("Aggregate - mixed int and double sum is a double") {
    Table t{
        Record{{"g", "a"s}, {"v", std::int64_t{1}}},
        Record{{"g", "a"s}, {"v", 0.5}},
    };
    auto out = tabula::runtime::aggregate_table(t, {"g"}, {make_agg("v", Statistic::Sum)});
    REQUIRE(out.has_value());
    REQUIRE(std::get<double>((*out)[0].get("v")) == Catch::Approx(1.5));
}

TEST_CASE("Aggregate - empty buckets reduce to their defaults") {
    std::vector<Value> nothing{Value{}, Value{"n/a"s}};
    REQUIRE(tabula::runtime::reduce(Statistic::Sum, nothing, "v") == int_value(0));
    REQUIRE(tabula::is_null(*tabula::runtime::reduce(Statistic::Mean, nothing, "v")));
    REQUIRE(tabula::is_null(*tabula::runtime::reduce(Statistic::Min, nothing, "v")));
    REQUIRE(tabula::is_null(*tabula::runtime::reduce(Statistic::Max, nothing, "v")));
    REQUIRE(tabula::runtime::reduce(Statistic::Count, nothing, "v") == int_value(1));

    std::vector<Value> one{Value{3.0}};
    REQUIRE(tabula::is_null(*tabula::runtime::reduce(Statistic::Std, one, "v")));
}

TEST_CASE("Aggregate - integer overflow is a computation error") {
    std::vector<Value> big{int_value(std::numeric_limits<std::int64_t>::max()), int_value(1)};
    auto sum = tabula::runtime::reduce(Statistic::Sum, big, "v");
    REQUIRE_FALSE(sum.has_value());
    REQUIRE(sum.error().kind == tabula::ErrorKind::Computation);
}

TEST_CASE("Aggregate - non-finite result is a computation error") {
    std::vector<Value> huge{Value{1e308}, Value{1e308}};
    auto sum = tabula::runtime::reduce(Statistic::Sum, huge, "v");
    REQUIRE_FALSE(sum.has_value());
    REQUIRE(sum.error().kind == tabula::ErrorKind::Computation);
}

TEST_CASE("Aggregate - validation errors") {
    auto empty_keys = tabula::runtime::aggregate_table(region_sales(), {}, {});
    REQUIRE_FALSE(empty_keys.has_value());
    REQUIRE(empty_keys.error().kind == tabula::ErrorKind::Validation);

    auto bad_key = tabula::runtime::aggregate_table(region_sales(), {"country"}, {});
    REQUIRE_FALSE(bad_key.has_value());
    REQUIRE(bad_key.error().message.find("country") != std::string::npos);

    auto bad_column = tabula::runtime::aggregate_table(region_sales(), {"region"},
                                                       {make_agg("profit", Statistic::Sum)});
    REQUIRE_FALSE(bad_column.has_value());
    REQUIRE(bad_column.error().kind == tabula::ErrorKind::Validation);
}

TEST_CASE("Aggregate - repeated column and statistic pair is rejected") {
    auto repeated = tabula::runtime::aggregate_table(
        region_sales(), {"region"},
        {make_agg("sales", Statistic::Mean), make_agg("sales", Statistic::Mean)});
    REQUIRE_FALSE(repeated.has_value());
    REQUIRE(repeated.error().kind == tabula::ErrorKind::Validation);
    REQUIRE(repeated.error().message.find("mean(sales)") != std::string::npos);

    auto distinct = tabula::runtime::aggregate_table(
        region_sales(), {"region"},
        {make_agg("sales", Statistic::Mean), make_agg("sales", Statistic::Max)});
    REQUIRE(distinct.has_value());
    REQUIRE((*distinct)[0].contains("sales_mean"));
    REQUIRE((*distinct)[0].contains("sales_max"));
}
