#include <tabula/io/csv.hpp>
#include <tabula/io/json.hpp>
#include <tabula/runtime/batch.hpp>
#include <tabula/runtime/catalog.hpp>
#include <tabula/runtime/dispatcher.hpp>
#include <tabula/runtime/ops.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

constexpr int kExitValidation = 1;
constexpr int kExitComputation = 2;

auto exit_code(const tabula::TransformError& error) -> int {
    return error.is_client_error() ? kExitValidation : kExitComputation;
}

auto read_file(const std::string& path) -> tabula::Expected<std::string> {
    std::ifstream input(path);
    if (!input) {
        return tabula::validation_error(fmt::format("failed to open '{}'", path));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void print_catalog() {
    for (const auto& info : tabula::runtime::describe_transformations()) {
        fmt::print("{}: {}\n", tabula::to_string(info.kind), info.description);
        fmt::print("  required: {}\n", fmt::join(info.required_parameters, ", "));
        if (!info.optional_parameters.empty()) {
            fmt::print("  optional: {}\n", fmt::join(info.optional_parameters, ", "));
        }
    }
    fmt::print("operators:  {}\n", fmt::join(tabula::runtime::supported_operators(), ", "));
    fmt::print("statistics: {}\n", fmt::join(tabula::runtime::supported_statistics(), ", "));
    fmt::print("methods:    {}\n", fmt::join(tabula::runtime::supported_methods(), ", "));
}

/// Apply the configured log level: --verbose wins, then --log-level, then TABULA_LOG_LEVEL.
void configure_logging(bool verbose, const std::string& level) {
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    spdlog::set_level(spdlog::level::warn);
    if (!level.empty()) {
        spdlog::set_level(spdlog::level::from_str(level));
    } else if (const char* env = std::getenv("TABULA_LOG_LEVEL"); env != nullptr) {
        spdlog::set_level(spdlog::level::from_str(env));
    }
}

auto run_single(const tabula::io::Json& document, const tabula::Table* csv_data, bool as_table)
    -> int {
    auto request = tabula::io::decode_request(document);
    if (!request) {
        std::cout << tabula::io::encode_error(request.error()).dump(2) << "\n";
        return exit_code(request.error());
    }
    if (csv_data != nullptr) {
        request->data = *csv_data;
    }
    auto result = tabula::runtime::execute(*request);
    if (!result) {
        spdlog::error("transformation error: {}", result.error().message);
        std::cout << tabula::io::encode_error(result.error()).dump(2) << "\n";
        return exit_code(result.error());
    }
    if (as_table) {
        tabula::ops::print(result->data, std::cout);
    } else {
        std::cout << tabula::io::encode_result(*result, request->kind()).dump(2) << "\n";
    }
    return 0;
}

auto run_batch(const tabula::io::Json& document, const tabula::runtime::BatchOptions& options)
    -> int {
    auto requests = tabula::io::decode_batch(document);
    if (!requests) {
        std::cout << tabula::io::encode_error(requests.error()).dump(2) << "\n";
        return exit_code(requests.error());
    }
    auto items = tabula::runtime::batch_execute(*requests, options);
    std::cout << tabula::io::encode_batch(*requests, items).dump(2) << "\n";
    int status = 0;
    for (const auto& item : items) {
        if (!item) {
            status = std::max(status, exit_code(item.error()));
        }
    }
    return status;
}

auto run_pipeline(const tabula::io::Json& document, const tabula::Table* csv_data, bool as_table)
    -> int {
    auto pipeline = tabula::io::decode_pipeline(document);
    if (!pipeline) {
        std::cout << tabula::io::encode_error(pipeline.error()).dump(2) << "\n";
        return exit_code(pipeline.error());
    }
    if (csv_data != nullptr) {
        pipeline->data = *csv_data;
    }
    auto result = tabula::runtime::run_pipeline(std::move(pipeline->data), pipeline->steps);
    if (!result) {
        spdlog::error("{}", result.error().format());
        std::cout << tabula::io::encode_pipeline_error(result.error()).dump(2) << "\n";
        return exit_code(result.error().error);
    }
    if (as_table) {
        tabula::ops::print(result->data, std::cout);
    } else {
        std::cout << tabula::io::encode_pipeline(*result).dump(2) << "\n";
    }
    return 0;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"Tabula transformation runner"};

    bool verbose = false;
    bool list = false;
    bool parallel = false;
    bool as_table = false;
    std::size_t max_workers = 0;
    std::string request_path;
    std::string csv_path;
    std::string null_spec = "<empty>";
    std::string mode = "single";
    std::string log_level;

    app.add_option("request", request_path, "Request JSON file");
    app.add_option("--csv", csv_path, "Replace the request data with this CSV file")
        ->check(CLI::ExistingFile);
    app.add_option("--nulls", null_spec, "Comma-separated CSV null tokens (<empty> = empty cell)");
    app.add_option("--mode", mode, "Request file layout")
        ->check(CLI::IsMember({"single", "batch", "pipeline"}));
    app.add_flag("--parallel", parallel, "Run batch items on worker threads");
    app.add_option("--max-workers", max_workers, "Worker thread limit (0 = hardware threads)");
    app.add_flag("--table", as_table, "Print the output table instead of the JSON envelope");
    app.add_flag("--list", list, "List the supported transformations and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("--log-level", log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    CLI11_PARSE(app, argc, argv);

    configure_logging(verbose, log_level);

    if (list) {
        print_catalog();
        return 0;
    }
    if (request_path.empty()) {
        fmt::print(stderr, "error: a request file is required (see --help)\n");
        return kExitValidation;
    }

    auto text = read_file(request_path);
    if (!text) {
        fmt::print(stderr, "error: {}\n", text.error().message);
        return kExitValidation;
    }
    auto document = tabula::io::parse_json(*text);
    if (!document) {
        fmt::print(stderr, "error: {}: {}\n", request_path, document.error().message);
        return kExitValidation;
    }

    tabula::Table csv_data;
    if (!csv_path.empty()) {
        auto loaded = tabula::io::read_csv(csv_path, null_spec);
        if (!loaded) {
            fmt::print(stderr, "error: {}\n", loaded.error());
            return kExitValidation;
        }
        csv_data = std::move(*loaded);
        spdlog::info("loaded {} records from {}", csv_data.rows(), csv_path);
    }
    const tabula::Table* override_data = csv_path.empty() ? nullptr : &csv_data;

    if (mode == "batch") {
        return run_batch(*document,
                         tabula::runtime::BatchOptions{.parallel = parallel,
                                                       .max_workers = max_workers});
    }
    if (mode == "pipeline") {
        return run_pipeline(*document, override_data, as_table);
    }
    return run_single(*document, override_data, as_table);
}
