#include <tabula/runtime/catalog.hpp>

#include <cstdint>

namespace tabula::runtime {

namespace {

template <typename Enum>
auto enumerate_names(Enum last) -> std::vector<std::string_view> {
    std::vector<std::string_view> out;
    for (auto i = 0; i <= static_cast<int>(last); ++i) {
        out.push_back(to_string(static_cast<Enum>(i)));
    }
    return out;
}

}  // namespace

auto describe_transformations() -> std::vector<TransformationInfo> {
    return {
        TransformationInfo{
            .kind = TransformKind::Aggregate,
            .description = "Group data by specified columns and apply aggregation functions",
            .required_parameters = {"group_by"},
            .optional_parameters = {"aggregations"},
        },
        TransformationInfo{
            .kind = TransformKind::Filter,
            .description = "Filter data based on specified conditions",
            .required_parameters = {"conditions"},
            .optional_parameters = {},
        },
        TransformationInfo{
            .kind = TransformKind::Normalize,
            .description = "Normalize numerical columns using various methods",
            .required_parameters = {"columns"},
            .optional_parameters = {"method"},
        },
        TransformationInfo{
            .kind = TransformKind::Pivot,
            .description = "Pivot data to create a cross-tabulated format",
            .required_parameters = {"index", "columns", "values"},
            .optional_parameters = {"aggfunc"},
        },
    };
}

auto supported_operators() -> std::vector<std::string_view> {
    return enumerate_names(CompareOp::In);
}

auto supported_statistics() -> std::vector<std::string_view> {
    return enumerate_names(Statistic::Std);
}

auto supported_methods() -> std::vector<std::string_view> {
    return enumerate_names(NormalizeMethod::Robust);
}

}  // namespace tabula::runtime
