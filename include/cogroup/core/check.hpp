// ============================================================================
// cogroup/core/check.hpp - Always-On Assertions
// ============================================================================
//
// COGROUP_CHECK(cond, msg) is never compiled out. On failure it writes the
// condition, the message and the source location to stderr and aborts.
// Reserved for programming errors (awaiting a Task twice, releasing a
// detached frame twice); runtime failures are reported as Error values.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace cogroup::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    std::fprintf(stderr, "COGROUP_CHECK(%s) failed: %s\n  in %s (%s:%u)\n", cond_str, msg, loc.function_name(),
                 loc.file_name(), static_cast<unsigned>(loc.line()));
    std::abort();
}

}  // namespace cogroup::detail

#define COGROUP_CHECK(cond, msg)                                                       \
    do {                                                                               \
        if (!(cond)) [[unlikely]] {                                                    \
            ::cogroup::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                              \
    } while (0)
