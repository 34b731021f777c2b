#pragma once

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>

namespace tabula {

enum class ErrorKind : std::uint8_t {
    /// Malformed request; the caller can fix it (4xx-equivalent).
    Validation,
    /// An invariant broke while reducing (5xx-equivalent).
    Computation,
};

/// Error value carried by every fallible runtime call.
struct TransformError {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;

    [[nodiscard]] auto is_client_error() const noexcept -> bool {
        return kind == ErrorKind::Validation;
    }

    /// "validation error: <message>" / "computation error: <message>".
    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Expected = std::expected<T, TransformError>;

[[nodiscard]] auto validation_error(std::string message) -> std::unexpected<TransformError>;
[[nodiscard]] auto computation_error(std::string message) -> std::unexpected<TransformError>;

/// Thrown by the `ops` convenience layer for ErrorKind::Validation.
class ValidationError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// Thrown by the `ops` convenience layer for ErrorKind::Computation.
class ComputationError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// Raise `error` as the matching exception type.
[[noreturn]] void throw_error(const TransformError& error);

}  // namespace tabula
