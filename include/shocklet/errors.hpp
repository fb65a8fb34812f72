#pragma once

/// @file include/shocklet/errors.hpp
/// @brief Error taxonomy for the shocklet library.
///
/// Every fallible operation validates its inputs up front and throws one of
/// the types below before producing any output. Nothing is retried: the
/// computations are pure, so a failure reproduces until the input changes.
///
///   InvalidParameter : malformed shape/size arguments (L < 2, unknown family
///                      name, k out of range, empty window)
///   DegenerateInput  : inputs that force a division by zero (constant array,
///                      zero-width sampling range, zero standard deviation)
///   DomainError      : values outside a function's numeric domain
///                      (non-positive argument to log10, overflowing exp)

#include <stdexcept>
#include <string>
#include <string_view>

namespace shocklet {

enum class ErrorKind {
    InvalidParameter,
    DegenerateInput,
    DomainError,
};

/// Human-readable name of an ErrorKind.
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Base class of every exception thrown by the library.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidParameter : public Error {
public:
    explicit InvalidParameter(const std::string& message)
        : Error(ErrorKind::InvalidParameter, message) {}
};

class DegenerateInput : public Error {
public:
    explicit DegenerateInput(const std::string& message)
        : Error(ErrorKind::DegenerateInput, message) {}
};

class DomainError : public Error {
public:
    explicit DomainError(const std::string& message)
        : Error(ErrorKind::DomainError, message) {}
};

} // namespace shocklet
