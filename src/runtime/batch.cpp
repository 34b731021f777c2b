#include <tabula/runtime/batch.hpp>
#include <tabula/runtime/dispatcher.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

namespace tabula::runtime {

namespace {

/// Run one item; anything thrown below the dispatcher is reported as a
/// computation error for that item alone.
auto execute_item(const TransformationRequest& request, std::size_t index) -> BatchItem {
    try {
        auto result = execute(request);
        if (!result) {
            spdlog::warn("batch item {} ({}) failed: {}", index, to_string(request.kind()),
                         result.error().format());
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::warn("batch item {} ({}) raised: {}", index, to_string(request.kind()), e.what());
        return computation_error(fmt::format("batch item {} raised: {}", index, e.what()));
    }
}

}  // namespace

auto batch_execute(const std::vector<TransformationRequest>& requests,
                   const BatchOptions& options) -> std::vector<BatchItem> {
    const std::size_t n = requests.size();
    std::vector<BatchItem> results(n);

    const std::size_t hw = std::max<unsigned>(1, std::thread::hardware_concurrency());
    const std::size_t limit = options.max_workers == 0 ? hw : options.max_workers;
    const std::size_t threads = std::min(n, limit);

    if (!options.parallel || threads <= 1) {
        for (std::size_t i = 0; i < n; ++i) {
            results[i] = execute_item(requests[i], i);
        }
        return results;
    }

    // Each worker owns a contiguous range of result slots.
    const std::size_t chunk = (n + threads - 1) / threads;
    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        std::size_t start = t * chunk;
        if (start >= n) {
            break;
        }
        std::size_t end = std::min(n, start + chunk);
        workers.emplace_back([&, start, end] {
            for (std::size_t i = start; i < end; ++i) {
                results[i] = execute_item(requests[i], i);
            }
        });
    }
    for (auto& th : workers) {
        th.join();
    }
    return results;
}

auto PipelineError::format() const -> std::string {
    if (step == 0) {
        return error.format();
    }
    return fmt::format("step {} ({}) failed: {}", step, kind ? to_string(*kind) : "unknown",
                       error.format());
}

auto run_pipeline(Table data, const std::vector<Parameters>& steps)
    -> std::expected<PipelineResult, PipelineError> {
    if (steps.empty()) {
        return std::unexpected(PipelineError{
            .step = 0,
            .kind = std::nullopt,
            .error = TransformError{.kind = ErrorKind::Validation,
                                    .message = "pipeline requires at least one transformation"}});
    }

    auto start = std::chrono::steady_clock::now();
    PipelineResult pipeline;
    pipeline.steps.reserve(steps.size());
    for (std::size_t i = 0; i < steps.size(); ++i) {
        TransformationRequest request{.data = std::move(data), .parameters = steps[i]};
        auto result = execute(request);
        if (!result) {
            return std::unexpected(PipelineError{
                .step = i + 1, .kind = request.kind(), .error = std::move(result.error())});
        }
        pipeline.steps.push_back(StepReport{.step = i + 1,
                                            .kind = request.kind(),
                                            .metadata = std::move(result->metadata),
                                            .processing_time_ms = result->processing_time_ms});
        data = std::move(result->data);
    }
    pipeline.data = std::move(data);
    pipeline.processing_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return pipeline;
}

}  // namespace tabula::runtime
