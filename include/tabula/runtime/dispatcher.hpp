#pragma once

#include <tabula/runtime/error.hpp>
#include <tabula/runtime/request.hpp>

namespace tabula::runtime {

/// Parameter-shape checks for the request's transformation type. Checks that need
/// the data (column existence) run inside the component for non-empty tables.
[[nodiscard]] auto validate(const TransformationRequest& request) -> Expected<void>;

/// Validate, run the matching component and wrap its table with metadata.
///
/// An empty input table yields an empty result with zeroed counters.
/// processing_time_ms covers only the component call. Component errors are
/// returned unchanged; no partial table is ever returned.
[[nodiscard]] auto execute(const TransformationRequest& request)
    -> Expected<TransformationResult>;

}  // namespace tabula::runtime
