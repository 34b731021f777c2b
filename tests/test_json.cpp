#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <tabula/io/json.hpp>
#include <tabula/runtime/dispatcher.hpp>

#include <cmath>
#include <string>

using namespace std::string_literals;
using tabula::Value;
using tabula::io::Json;

TEST_CASE("JSON - decode scalar values") {
    REQUIRE(*tabula::io::decode_value(Json(nullptr)) == Value{});
    REQUIRE(*tabula::io::decode_value(Json(true)) == Value{true});
    REQUIRE(*tabula::io::decode_value(Json(42)) == Value{std::int64_t{42}});
    REQUIRE(*tabula::io::decode_value(Json(-3)) == Value{std::int64_t{-3}});
    REQUIRE(*tabula::io::decode_value(Json(2.5)) == Value{2.5});
    REQUIRE(*tabula::io::decode_value(Json("hi")) == Value{"hi"s});
    REQUIRE_FALSE(tabula::io::decode_value(Json::array()).has_value());
    REQUIRE_FALSE(tabula::io::decode_value(Json::object()).has_value());
}

TEST_CASE("JSON - records keep key order") {
    auto json = Json::parse(R"({"zeta": 1, "alpha": "a", "mid": null})");
    auto record = tabula::io::decode_record(json);
    REQUIRE(record.has_value());
    REQUIRE(record->fields()[0].name == "zeta");
    REQUIRE(record->fields()[1].name == "alpha");
    REQUIRE(record->fields()[2].name == "mid");
    REQUIRE(tabula::is_null(record->get("mid")));
}

TEST_CASE("JSON - decode an aggregate request") {
    auto json = Json::parse(R"({
        "data": [
            {"region": "North", "sales": 100},
            {"region": "North", "sales": 150},
            {"region": "South", "sales": 200}
        ],
        "transformation_type": "aggregate",
        "parameters": {"group_by": ["region"], "aggregations": {"sales": "sum"}}
    })");
    auto request = tabula::io::decode_request(json);
    REQUIRE(request.has_value());
    REQUIRE(request->kind() == tabula::TransformKind::Aggregate);
    REQUIRE(request->data.rows() == 3);
    const auto& params = std::get<tabula::AggregateParams>(request->parameters);
    REQUIRE(params.group_by == std::vector<std::string>{"region"});
    REQUIRE(params.aggregations.size() == 1);
    REQUIRE(params.aggregations[0].column == "sales");
    REQUIRE(params.aggregations[0].stat == tabula::Statistic::Sum);
}

TEST_CASE("JSON - filter conditions as object or array") {
    auto single =
        Json::parse(R"({"conditions": {"field": "age", "operator": "gte", "value": 30}})");
    auto one = tabula::io::decode_parameters(tabula::TransformKind::Filter, single);
    REQUIRE(one.has_value());
    const auto& filter = std::get<tabula::FilterParams>(*one);
    REQUIRE(filter.conditions.size() == 1);
    REQUIRE(filter.conditions[0].op == tabula::CompareOp::Gte);
    REQUIRE(std::get<Value>(filter.conditions[0].value) == Value{std::int64_t{30}});

    auto many = Json::parse(R"({"conditions": [
        {"field": "age", "operator": "gte", "value": 30},
        {"field": "city", "operator": "in", "value": ["New York", "Chicago"]}
    ]})");
    auto two = tabula::io::decode_parameters(tabula::TransformKind::Filter, many);
    REQUIRE(two.has_value());
    const auto& both = std::get<tabula::FilterParams>(*two);
    REQUIRE(both.conditions.size() == 2);
    REQUIRE(std::get<std::vector<Value>>(both.conditions[1].value).size() == 2);
}

TEST_CASE("JSON - pivot accepts columns or pivot_columns") {
    auto a = tabula::io::decode_parameters(
        tabula::TransformKind::Pivot,
        Json::parse(R"({"index": "region", "columns": "product", "values": "sales"})"));
    REQUIRE(a.has_value());
    REQUIRE(std::get<tabula::PivotParams>(*a).pivot_columns == "product");
    REQUIRE(std::get<tabula::PivotParams>(*a).aggfunc == tabula::Statistic::Sum);

    auto b = tabula::io::decode_parameters(
        tabula::TransformKind::Pivot,
        Json::parse(R"({"index": "region", "pivot_columns": "product", "values": "sales",
                        "aggfunc": "mean"})"));
    REQUIRE(b.has_value());
    REQUIRE(std::get<tabula::PivotParams>(*b).pivot_columns == "product");
    REQUIRE(std::get<tabula::PivotParams>(*b).aggfunc == tabula::Statistic::Mean);

    auto missing = tabula::io::decode_parameters(tabula::TransformKind::Pivot,
                                                 Json::parse(R"({"index": "region"})"));
    REQUIRE_FALSE(missing.has_value());
}

TEST_CASE("JSON - normalize defaults to min_max") {
    auto params = tabula::io::decode_parameters(tabula::TransformKind::Normalize,
                                                Json::parse(R"({"columns": ["price"]})"));
    REQUIRE(params.has_value());
    REQUIRE(std::get<tabula::NormalizeParams>(*params).method == tabula::NormalizeMethod::MinMax);
}

TEST_CASE("JSON - malformed requests are validation errors") {
    auto unknown_type = tabula::io::decode_request(
        Json::parse(R"({"data": [], "transformation_type": "sort", "parameters": {}})"));
    REQUIRE_FALSE(unknown_type.has_value());
    REQUIRE(unknown_type.error().kind == tabula::ErrorKind::Validation);

    auto no_group_by = tabula::io::decode_request(
        Json::parse(R"({"data": [], "transformation_type": "aggregate", "parameters": {}})"));
    REQUIRE_FALSE(no_group_by.has_value());
    REQUIRE(no_group_by.error().message.find("group_by") != std::string::npos);

    auto bad_stat = tabula::io::decode_parameters(
        tabula::TransformKind::Aggregate,
        Json::parse(R"({"group_by": "g", "aggregations": {"v": "median"}})"));
    REQUIRE_FALSE(bad_stat.has_value());

    auto bad_op = tabula::io::decode_parameters(
        tabula::TransformKind::Filter,
        Json::parse(R"({"conditions": {"field": "a", "operator": "like", "value": 1}})"));
    REQUIRE_FALSE(bad_op.has_value());

    auto no_value = tabula::io::decode_request(Json::parse(R"({
        "data": [{"a": 1}, {"a": null}],
        "transformation_type": "filter",
        "parameters": {"conditions": {"field": "a", "operator": "eq"}}
    })"));
    REQUIRE_FALSE(no_value.has_value());
    REQUIRE(no_value.error().kind == tabula::ErrorKind::Validation);
    REQUIRE(no_value.error().message.find("'value'") != std::string::npos);

    auto explicit_null = tabula::io::decode_parameters(
        tabula::TransformKind::Filter,
        Json::parse(R"({"conditions": {"field": "a", "operator": "eq", "value": null}})"));
    REQUIRE(explicit_null.has_value());

    REQUIRE_FALSE(tabula::io::parse_json("{not json").has_value());
}

TEST_CASE("JSON - result envelope") {
    auto request = tabula::io::decode_request(Json::parse(R"({
        "data": [{"x": 10}, {"x": 20}, {"x": 30}],
        "transformation_type": "normalize",
        "parameters": {"columns": ["x"], "method": "min_max"}
    })"));
    REQUIRE(request.has_value());
    auto result = tabula::runtime::execute(*request);
    REQUIRE(result.has_value());

    auto envelope = tabula::io::encode_result(*result, request->kind());
    REQUIRE(envelope["success"] == true);
    REQUIRE(envelope["message"] == "Successfully applied normalize transformation");
    REQUIRE(envelope["data"].size() == 3);
    REQUIRE(envelope["data"][1]["x"].get<double>() == Catch::Approx(0.5));
    REQUIRE(envelope["metadata"]["original_rows"] == 3);
    REQUIRE(envelope["metadata"]["normalization_method"] == "min_max");
    REQUIRE(envelope["metadata"]["statistics"]["x"]["original_mean"].get<double>() ==
            Catch::Approx(20.0));
    REQUIRE(envelope["processing_time_ms"].is_number());
}

TEST_CASE("JSON - error envelope") {
    tabula::TransformError error{.kind = tabula::ErrorKind::Computation, .message = "boom"};
    auto envelope = tabula::io::encode_error(error);
    REQUIRE(envelope["success"] == false);
    REQUIRE(envelope["message"] == "Transformation failed: boom");
    REQUIRE(envelope["error_kind"] == "computation");
    REQUIRE(envelope["data"].empty());
}

TEST_CASE("JSON - non-finite doubles encode as null") {
    REQUIRE(tabula::io::encode_value(Value{std::nan("")}).is_null());
    REQUIRE(tabula::io::encode_value(Value{}).is_null());
    REQUIRE(tabula::io::encode_value(Value{std::int64_t{5}}) == 5);
}

TEST_CASE("JSON - batch and pipeline documents") {
    auto batch = tabula::io::decode_batch(Json::parse(R"({"requests": [
        {"data": [{"a": 1}], "transformation_type": "filter",
         "parameters": {"conditions": {"field": "a", "operator": "eq", "value": 1}}},
        {"data": [{"a": 1}], "transformation_type": "aggregate",
         "parameters": {"group_by": ["a"]}}
    ]})"));
    REQUIRE(batch.has_value());
    REQUIRE(batch->size() == 2);

    auto pipeline = tabula::io::decode_pipeline(Json::parse(R"({
        "data": [{"a": 1}, {"a": 2}],
        "transformations": [
            {"transformation_type": "filter",
             "parameters": {"conditions": {"field": "a", "operator": "gt", "value": 1}}},
            {"transformation_type": "normalize", "parameters": {"columns": "a"}}
        ]
    })"));
    REQUIRE(pipeline.has_value());
    REQUIRE(pipeline->data.rows() == 2);
    REQUIRE(pipeline->steps.size() == 2);

    auto missing_type = tabula::io::decode_pipeline(Json::parse(R"({
        "data": [{"a": 1}],
        "transformations": [{"parameters": {}}]
    })"));
    REQUIRE_FALSE(missing_type.has_value());
    REQUIRE(missing_type.error().message.find("step 1") != std::string::npos);
}
