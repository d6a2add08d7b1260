// ============================================================================
// cogroup/core/coroutine_compat.hpp - Symmetric Transfer Portability
// ============================================================================
//
// GCC with AddressSanitizer does not emit the tail call symmetric transfer
// relies on (https://gcc.gnu.org/bugzilla/show_bug.cgi?id=100897). Under
// that configuration await_suspend returns void and resumes the target
// directly; everywhere else it returns the handle.
//
//   SymmetricTransferResult await_suspend(std::coroutine_handle<> h) noexcept {
//       return SymmetricTransfer(next);
//   }
//
// ============================================================================

#pragma once

#include <coroutine>

namespace cogroup {

#if defined(__GNUG__) && !defined(__clang__) && defined(__SANITIZE_ADDRESS__)
#define COGROUP_ASAN_SYMMETRIC_TRANSFER_BROKEN 1
#else
#define COGROUP_ASAN_SYMMETRIC_TRANSFER_BROKEN 0
#endif

#if COGROUP_ASAN_SYMMETRIC_TRANSFER_BROKEN

using SymmetricTransferResult = void;

inline void SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    target.resume();
}

#else

using SymmetricTransferResult = std::coroutine_handle<>;

inline std::coroutine_handle<> SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    return target;
}

#endif

}  // namespace cogroup
