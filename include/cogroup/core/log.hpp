// ============================================================================
// cogroup/core/log.hpp - Library Log Level
// ============================================================================
//
// The library logs through spdlog's default logger. spdlog types stay out
// of the public headers; applications adjust verbosity here or configure
// spdlog directly.
//
// ============================================================================

#pragma once

#include <cstdint>

namespace cogroup {

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off,
};

void SetLogLevel(LogLevel level) noexcept;

[[nodiscard]] LogLevel GetLogLevel() noexcept;

}  // namespace cogroup
