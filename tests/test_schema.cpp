#include <catch2/catch_test_macros.hpp>

#include <tabula/core/schema.hpp>

#include <string>

using namespace std::string_literals;
using tabula::Record;
using tabula::Table;
using tabula::Value;

TEST_CASE("Schema - columns in first-seen order") {
    Table t{
        Record{{"name", "Alice"s}, {"age", std::int64_t{30}}},
        Record{{"age", std::int64_t{25}}, {"city", "Paris"s}},
    };
    auto schema = tabula::infer_schema(t);
    const std::vector<std::string> expected{"name", "age", "city"};
    REQUIRE(schema.names() == expected);
    REQUIRE(tabula::format_columns(schema) == "name, age, city");
}

TEST_CASE("Schema - int and double widen to double") {
    Table t{
        Record{{"x", std::int64_t{1}}},
        Record{{"x", 2.5}},
    };
    auto schema = tabula::infer_schema(t);
    const auto* x = schema.find("x");
    REQUIRE(x != nullptr);
    REQUIRE(x->kind == tabula::ValueKind::Double);
    REQUIRE_FALSE(x->mixed);
    REQUIRE(x->numeric());
}

TEST_CASE("Schema - mixed kinds and null counting") {
    Table t{
        Record{{"v", std::int64_t{1}}, {"w", Value{}}},
        Record{{"v", "one"s}},
        Record{{"v", Value{}}},
    };
    auto schema = tabula::infer_schema(t);
    const auto* v = schema.find("v");
    REQUIRE(v != nullptr);
    REQUIRE(v->mixed);
    REQUIRE(v->non_null == 2);
    REQUIRE(v->nulls == 1);
    REQUIRE_FALSE(v->numeric());

    // Explicit null plus two records lacking the column.
    const auto* w = schema.find("w");
    REQUIRE(w != nullptr);
    REQUIRE(w->non_null == 0);
    REQUIRE(w->nulls == 3);
    REQUIRE(schema.numeric_columns().empty());
}

TEST_CASE("Schema - empty table") {
    auto schema = tabula::infer_schema(Table{});
    REQUIRE(schema.columns.empty());
    REQUIRE(tabula::format_columns(schema) == "<none>");
}
