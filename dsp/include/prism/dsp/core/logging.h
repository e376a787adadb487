// ==============================================================================
// Layer 0: Core Utility - Library Logger
// ==============================================================================
// PrismDSP logs through one named spdlog logger ("prism") writing to stderr.
// The logger is created on first use; its level defaults to warn and can be
// overridden with the SPDLOG_LEVEL environment variable (read once, at
// creation) or with setLogLevel() at any time.
//
// Log output never influences numeric results.
// ==============================================================================

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace Prism {
namespace DSP {

/// @brief Name under which the library logger is registered with spdlog.
inline constexpr const char* kLoggerName = "prism";

/// @brief Get the library logger, creating and registering it if needed.
/// @note Thread-safe.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// @brief Change the library log level.
void setLogLevel(spdlog::level::level_enum level);

} // namespace DSP
} // namespace Prism
