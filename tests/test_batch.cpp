#include <catch2/catch_test_macros.hpp>

#include <tabula/runtime/batch.hpp>
#include <tabula/runtime/ops.hpp>

#include <string>
#include <vector>

using namespace std::string_literals;
using tabula::CompareOp;
using tabula::Record;
using tabula::Statistic;
using tabula::Table;
using tabula::TransformationRequest;
using tabula::Value;

namespace {

auto sales() -> Table {
    return Table{
        Record{{"region", "North"s}, {"sales", std::int64_t{100}}},
        Record{{"region", "North"s}, {"sales", std::int64_t{150}}},
        Record{{"region", "South"s}, {"sales", std::int64_t{200}}},
        Record{{"region", "South"s}, {"sales", std::int64_t{120}}},
    };
}

auto mixed_requests() -> std::vector<TransformationRequest> {
    return {
        TransformationRequest{
            .data = sales(),
            .parameters = tabula::AggregateParams{
                .group_by = {"region"},
                .aggregations = {tabula::ops::make_agg("sales", Statistic::Sum)}}},
        TransformationRequest{
            .data = sales(),
            .parameters = tabula::FilterParams{
                .conditions = {tabula::ops::where("missing", CompareOp::Eq, "x"s)}}},
        TransformationRequest{
            .data = sales(),
            .parameters = tabula::FilterParams{
                .conditions = {tabula::ops::where("sales", CompareOp::Gt, std::int64_t{120})}}},
    };
}

}  // namespace

TEST_CASE("Batch - failures are isolated per item") {
    auto requests = mixed_requests();
    auto items = tabula::runtime::batch_execute(requests);
    REQUIRE(items.size() == 3);
    REQUIRE(items[0].has_value());
    REQUIRE(items[0]->data.rows() == 2);
    REQUIRE_FALSE(items[1].has_value());
    REQUIRE(items[1].error().kind == tabula::ErrorKind::Validation);
    REQUIRE(items[2].has_value());
    REQUIRE(items[2]->data.rows() == 2);
}

TEST_CASE("Batch - parallel execution matches sequential") {
    std::vector<TransformationRequest> requests;
    for (int i = 0; i < 6; ++i) {
        auto more = mixed_requests();
        requests.insert(requests.end(), more.begin(), more.end());
    }
    auto sequential = tabula::runtime::batch_execute(requests);
    auto parallel = tabula::runtime::batch_execute(
        requests, tabula::runtime::BatchOptions{.parallel = true, .max_workers = 4});
    REQUIRE(parallel.size() == sequential.size());
    for (std::size_t i = 0; i < sequential.size(); ++i) {
        REQUIRE(parallel[i].has_value() == sequential[i].has_value());
        if (sequential[i]) {
            REQUIRE(parallel[i]->data == sequential[i]->data);
        } else {
            REQUIRE(parallel[i].error().message == sequential[i].error().message);
        }
    }
}

TEST_CASE("Batch - empty batch") {
    REQUIRE(tabula::runtime::batch_execute({}).empty());
}

TEST_CASE("Pipeline - steps chain over the previous output") {
    std::vector<tabula::Parameters> steps{
        tabula::FilterParams{
            .conditions = {tabula::ops::where("sales", CompareOp::Gte, std::int64_t{120})}},
        tabula::AggregateParams{.group_by = {"region"},
                                .aggregations = {tabula::ops::make_agg("sales", Statistic::Sum)}},
    };
    auto result = tabula::runtime::run_pipeline(sales(), steps);
    REQUIRE(result.has_value());
    REQUIRE(result->steps.size() == 2);
    REQUIRE(result->steps[0].step == 1);
    REQUIRE(result->steps[0].kind == tabula::TransformKind::Filter);
    REQUIRE(result->steps[0].metadata.get_int("filtered_rows") == 3);
    REQUIRE(result->steps[1].step == 2);
    REQUIRE(result->steps[1].metadata.get_int("original_rows") == 3);

    Table expected{
        Record{{"region", "North"s}, {"sales", std::int64_t{150}}},
        Record{{"region", "South"s}, {"sales", std::int64_t{320}}},
    };
    REQUIRE(result->data == expected);
}

TEST_CASE("Pipeline - stops at the first failing step") {
    std::vector<tabula::Parameters> steps{
        tabula::AggregateParams{.group_by = {"region"}},
        tabula::NormalizeParams{.columns = {"sales"}},
        tabula::FilterParams{
            .conditions = {tabula::ops::where("count", CompareOp::Gt, std::int64_t{0})}},
    };
    auto result = tabula::runtime::run_pipeline(sales(), steps);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().step == 2);
    REQUIRE(result.error().kind == tabula::TransformKind::Normalize);
    REQUIRE(result.error().error.kind == tabula::ErrorKind::Validation);
    REQUIRE(result.error().format().starts_with("step 2 (normalize) failed: "));
}

TEST_CASE("Pipeline - requires at least one step") {
    auto result = tabula::runtime::run_pipeline(sales(), {});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().step == 0);
    REQUIRE_FALSE(result.error().kind.has_value());
}
