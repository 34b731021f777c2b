#pragma once

#include <tabula/runtime/request.hpp>

#include <string_view>
#include <vector>

namespace tabula::runtime {

/// Self-description of one transformation type.
struct TransformationInfo {
    TransformKind kind = TransformKind::Aggregate;
    std::string_view description;
    std::vector<std::string_view> required_parameters;
    std::vector<std::string_view> optional_parameters;
};

[[nodiscard]] auto describe_transformations() -> std::vector<TransformationInfo>;

[[nodiscard]] auto supported_operators() -> std::vector<std::string_view>;
[[nodiscard]] auto supported_statistics() -> std::vector<std::string_view>;
[[nodiscard]] auto supported_methods() -> std::vector<std::string_view>;

}  // namespace tabula::runtime
