#pragma once

#include <tabula/runtime/error.hpp>
#include <tabula/runtime/request.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

namespace tabula::runtime {

struct BatchOptions {
    /// Spread items over worker threads. Results are identical either way.
    bool parallel = false;
    /// Upper bound on worker threads; 0 means std::thread::hardware_concurrency().
    std::size_t max_workers = 0;
};

using BatchItem = Expected<TransformationResult>;

/// Execute each request independently. The i-th entry is the i-th request's result
/// or error; one failure never stops the others.
[[nodiscard]] auto batch_execute(const std::vector<TransformationRequest>& requests,
                                 const BatchOptions& options = {}) -> std::vector<BatchItem>;

// ─── Pipelines ────────────────────────────────────────────────────────────────
//  Chained transformations: each step consumes the previous step's table.

struct StepReport {
    /// 1-based.
    std::size_t step = 0;
    TransformKind kind = TransformKind::Aggregate;
    Metadata metadata;
    double processing_time_ms = 0.0;
};

struct PipelineResult {
    Table data;
    std::vector<StepReport> steps;
    double processing_time_ms = 0.0;
};

struct PipelineError {
    /// 1-based step that failed; 0 when the pipeline itself is malformed.
    std::size_t step = 0;
    std::optional<TransformKind> kind;
    TransformError error;

    [[nodiscard]] auto format() const -> std::string;
};

/// Run `steps` in order over `data`, stopping at the first failing step.
[[nodiscard]] auto run_pipeline(Table data, const std::vector<Parameters>& steps)
    -> std::expected<PipelineResult, PipelineError>;

}  // namespace tabula::runtime
