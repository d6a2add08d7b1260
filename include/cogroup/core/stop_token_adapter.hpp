// ============================================================================
// cogroup/core/stop_token_adapter.hpp - std::stop_token Interop
// ============================================================================
//
// Two bridges between std::stop_token and CancellationToken:
//
//   FromStopToken: a std::jthread-style caller passes its stop_token as the
//   wait context of TaskGroup::Wait.
//
//     auto bridged = FromStopToken(thread_stop_token);
//     Error err = SyncWait(group.Wait(bridged.token));
//
//   LinkCancellation: a blocking unit waits on a condition variable and
//   still wakes up when the group is cancelled.
//
//     group.Go([&](CancellationToken token) -> Error {
//         std::stop_source stop;
//         auto link = LinkCancellation(token, stop);
//         std::unique_lock lock(mu);
//         cv.wait(lock, stop.get_token(), [&] { return ready; });
//         return Error{};
//     });
//
// ============================================================================

#pragma once

#include "cogroup/core/cancellation.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>

namespace cogroup {

class StopTokenBridge {
   public:
    explicit StopTokenBridge(std::stop_token st) {
        if (st.stop_possible()) {
            callback_.emplace(std::move(st), [this] { source_.Cancel(); });
        }
    }

    StopTokenBridge(const StopTokenBridge&) = delete;
    StopTokenBridge& operator=(const StopTokenBridge&) = delete;

    [[nodiscard]] CancellationToken GetToken() const { return source_.GetToken(); }

   private:
    // Declared first: the stop_callback must be destroyed before the source.
    CancellationSource source_;
    std::optional<std::stop_callback<std::function<void()>>> callback_;
};

// The bridge must outlive every use of the token.
struct StopTokenBridgeHandle {
    CancellationToken token;
    std::shared_ptr<StopTokenBridge> bridge;
};

inline StopTokenBridgeHandle FromStopToken(std::stop_token st) {
    auto bridge = std::make_shared<StopTokenBridge>(std::move(st));
    auto token = bridge->GetToken();
    return {std::move(token), std::move(bridge)};
}

class CancellationLink {
   public:
    CancellationLink(CancellationToken token, std::stop_source source) : token_(std::move(token)) {
        handle_ = token_.OnCancel([s = std::move(source)]() mutable { s.request_stop(); });
    }

    ~CancellationLink() { token_.Unregister(handle_); }

    CancellationLink(const CancellationLink&) = delete;
    CancellationLink& operator=(const CancellationLink&) = delete;
    CancellationLink(CancellationLink&&) = delete;
    CancellationLink& operator=(CancellationLink&&) = delete;

   private:
    CancellationToken token_;
    size_t handle_ = 0;
};

[[nodiscard]] inline std::unique_ptr<CancellationLink> LinkCancellation(CancellationToken token,
                                                                        std::stop_source source) {
    return std::make_unique<CancellationLink>(std::move(token), std::move(source));
}

}  // namespace cogroup
