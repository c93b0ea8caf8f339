#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string_view>

namespace sixpn::discovery {

enum class CompletionReason {
    cancellation_requested = 0,
    service_discovery_unavailable,
};

std::string_view ToString(CompletionReason reason);

using CompletionHandler = std::function<void(CompletionReason)>;

// Handle to a subscription. Copies share state.
//
// Thread-safe. The completion handler runs at most once, on the thread of
// whichever completion wins: Cancel() or the engine's shutdown.
class CancellationToken {
public:
    explicit CancellationToken(bool is_cancelled = false, CompletionHandler completion = {});

    bool IsCancelled() const;

    // Idempotent
    void Cancel() const;

private:
    friend class SubscriptionRegistry;

    // Returns false if the token was already completed.
    bool Complete(CompletionReason reason) const;

    struct State {
        std::atomic<bool> cancelled{false};
        CompletionHandler completion;
    };

    std::shared_ptr<State> state_;
};

} // namespace sixpn::discovery
