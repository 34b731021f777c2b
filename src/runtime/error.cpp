#include <tabula/runtime/error.hpp>

#include <fmt/format.h>

namespace tabula {

auto TransformError::format() const -> std::string {
    return fmt::format("{} error: {}", kind == ErrorKind::Validation ? "validation" : "computation",
                       message);
}

auto validation_error(std::string message) -> std::unexpected<TransformError> {
    return std::unexpected(
        TransformError{.kind = ErrorKind::Validation, .message = std::move(message)});
}

auto computation_error(std::string message) -> std::unexpected<TransformError> {
    return std::unexpected(
        TransformError{.kind = ErrorKind::Computation, .message = std::move(message)});
}

void throw_error(const TransformError& error) {
    if (error.kind == ErrorKind::Validation) {
        throw ValidationError(error.message);
    }
    throw ComputationError(error.message);
}

}  // namespace tabula
