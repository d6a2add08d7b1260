// ============================================================================
// cogroup/core/log.cpp - spdlog Level Mapping
// ============================================================================

#include "cogroup/core/log.hpp"

#include <spdlog/spdlog.h>

namespace cogroup {

namespace {

spdlog::level::level_enum ToSpdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
    }
    return spdlog::level::off;
}

LogLevel FromSpdlog(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:
            return LogLevel::Trace;
        case spdlog::level::debug:
            return LogLevel::Debug;
        case spdlog::level::info:
            return LogLevel::Info;
        case spdlog::level::warn:
            return LogLevel::Warn;
        case spdlog::level::err:
            return LogLevel::Error;
        case spdlog::level::critical:
            return LogLevel::Critical;
        default:
            return LogLevel::Off;
    }
}

}  // namespace

void SetLogLevel(LogLevel level) noexcept {
    spdlog::set_level(ToSpdlog(level));
}

LogLevel GetLogLevel() noexcept {
    return FromSpdlog(spdlog::get_level());
}

}  // namespace cogroup
