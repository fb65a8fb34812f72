/// @file src/core/errors.cpp
/// @brief Error base class and ErrorKind names.

#include "shocklet/errors.hpp"

#include <fmt/format.h>

namespace shocklet {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidParameter: return "InvalidParameter";
        case ErrorKind::DegenerateInput:  return "DegenerateInput";
        case ErrorKind::DomainError:      return "DomainError";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(fmt::format("{}: {}", to_string(kind), message))
    , kind_(kind) {}

} // namespace shocklet
