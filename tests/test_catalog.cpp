#include <catch2/catch_test_macros.hpp>

#include <tabula/runtime/catalog.hpp>

#include <string_view>
#include <vector>

TEST_CASE("Catalog - one entry per transformation type") {
    auto infos = tabula::runtime::describe_transformations();
    REQUIRE(infos.size() == 4);
    REQUIRE(infos[0].kind == tabula::TransformKind::Aggregate);
    REQUIRE(infos[1].kind == tabula::TransformKind::Filter);
    REQUIRE(infos[2].kind == tabula::TransformKind::Normalize);
    REQUIRE(infos[3].kind == tabula::TransformKind::Pivot);
    for (const auto& info : infos) {
        REQUIRE_FALSE(info.description.empty());
        REQUIRE_FALSE(info.required_parameters.empty());
    }
    const std::vector<std::string_view> pivot_required{"index", "columns", "values"};
    REQUIRE(infos[3].required_parameters == pivot_required);
}

TEST_CASE("Catalog - supported tokens parse back") {
    const std::vector<std::string_view> operators{"eq", "ne",  "gt",       "gte",
                                                  "lt", "lte", "contains", "in"};
    REQUIRE(tabula::runtime::supported_operators() == operators);
    for (auto op : operators) {
        REQUIRE(tabula::parse_compare_op(op).has_value());
    }

    const std::vector<std::string_view> statistics{"sum", "mean", "count", "min", "max", "std"};
    REQUIRE(tabula::runtime::supported_statistics() == statistics);

    const std::vector<std::string_view> methods{"min_max", "z_score", "robust"};
    REQUIRE(tabula::runtime::supported_methods() == methods);
    for (auto method : methods) {
        REQUIRE(tabula::parse_normalize_method(method).has_value());
    }
}

TEST_CASE("Catalog - unknown tokens do not parse") {
    REQUIRE_FALSE(tabula::parse_transform_kind("sort").has_value());
    REQUIRE_FALSE(tabula::parse_statistic("median").has_value());
    REQUIRE_FALSE(tabula::parse_compare_op("like").has_value());
    REQUIRE_FALSE(tabula::parse_normalize_method("minmax").has_value());
}
