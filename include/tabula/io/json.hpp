#pragma once

#include <tabula/runtime/batch.hpp>
#include <tabula/runtime/error.hpp>
#include <tabula/runtime/request.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <vector>

namespace tabula::io {

/// Key order matters: records keep their field order through a round trip.
using Json = nlohmann::ordered_json;

/// A pipeline file: one input table and the steps to chain over it.
struct PipelineRequest {
    Table data;
    std::vector<Parameters> steps;
};

// ─── Decoding ─────────────────────────────────────────────────────────────────
//  Every decoder reports a malformed document as a validation error.

/// Scalars only; arrays and objects are rejected.
[[nodiscard]] auto decode_value(const Json& json) -> Expected<Value>;
[[nodiscard]] auto decode_record(const Json& json) -> Expected<Record>;
[[nodiscard]] auto decode_table(const Json& json) -> Expected<Table>;

/// `parameters` object for the given transformation type.
[[nodiscard]] auto decode_parameters(TransformKind kind, const Json& json) -> Expected<Parameters>;

/// {"data": [...], "transformation_type": "...", "parameters": {...}}
[[nodiscard]] auto decode_request(const Json& json) -> Expected<TransformationRequest>;

/// {"requests": [...]} or a bare array of requests.
[[nodiscard]] auto decode_batch(const Json& json) -> Expected<std::vector<TransformationRequest>>;

/// {"data": [...], "transformations": [{"transformation_type": ..., "parameters": ...}]}
[[nodiscard]] auto decode_pipeline(const Json& json) -> Expected<PipelineRequest>;

/// Parse text, mapping a syntax error to a validation error.
[[nodiscard]] auto parse_json(std::string_view text) -> Expected<Json>;

// ─── Encoding ─────────────────────────────────────────────────────────────────
//  Response envelopes: {"success", "message", "data", "metadata", "processing_time_ms"}.

/// Non-finite doubles encode as null.
[[nodiscard]] auto encode_value(const Value& value) -> Json;
[[nodiscard]] auto encode_table(const Table& table) -> Json;
[[nodiscard]] auto encode_metadata(const Metadata& metadata,
                                   const std::vector<ColumnStatistics>& statistics = {}) -> Json;

[[nodiscard]] auto encode_result(const TransformationResult& result, TransformKind kind) -> Json;
[[nodiscard]] auto encode_error(const TransformError& error) -> Json;

/// {"success": <all items succeeded>, "results": [envelope, ...]}
[[nodiscard]] auto encode_batch(const std::vector<TransformationRequest>& requests,
                                const std::vector<runtime::BatchItem>& items) -> Json;

[[nodiscard]] auto encode_pipeline(const runtime::PipelineResult& result) -> Json;
[[nodiscard]] auto encode_pipeline_error(const runtime::PipelineError& error) -> Json;

}  // namespace tabula::io
