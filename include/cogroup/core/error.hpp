// ============================================================================
// cogroup/core/error.hpp - Error Codes for cogroup
// ============================================================================
//
// Every failure the library reports is a std::error_code. Codes that belong
// to the library itself live in the cogroup category; task functions are free
// to return codes from any category (std::errc, system errors, their own).
//
// An empty Error{} means success, mirroring a nil error.
//
// ============================================================================

#pragma once

#include <system_error>

namespace cogroup {

enum class Errc {
    Cancelled = 1,
    DeadlineExceeded,
    InvalidArgument,
    IoError,
    NoExecutor,
};

const std::error_category& CogroupCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

using Error = std::error_code;

}  // namespace cogroup

namespace std {
template <>
struct is_error_code_enum<cogroup::Errc> : true_type {};
}  // namespace std
