// ==============================================================================
// Layer 0: Core Utility - Signal Errors
// ==============================================================================
// Exception types raised by the spectrum model.
//
// - ConfigurationError: a signal cannot be built (non-positive duration or
//   sample rate, zero bins) or two signals are combined that do not share
//   a bin layout.
// - DomainError: a synthesis parameter lies outside its mathematical domain.
//   Raised before any mutation, so a failed call leaves the spectrum intact.
//
// Frequencies above Nyquist are not errors; they alias.
// ==============================================================================

#pragma once

#include <stdexcept>
#include <string>

namespace Prism {
namespace DSP {

/// @brief Invalid signal layout (duration, sample rate, bin count).
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// @brief Parameter outside the domain of a synthesis operation.
class DomainError : public std::domain_error {
public:
    explicit DomainError(const std::string& what)
        : std::domain_error(what) {}
};

} // namespace DSP
} // namespace Prism
