#include <sixpn/discovery/cancellation_token.h>

namespace sixpn::discovery {

std::string_view ToString(CompletionReason reason) {
    switch (reason) {
        case CompletionReason::cancellation_requested: return "cancellation_requested";
        case CompletionReason::service_discovery_unavailable: return "service_discovery_unavailable";
    }
    return "unknown";
}

CancellationToken::CancellationToken(bool is_cancelled, CompletionHandler completion)
    : state_(std::make_shared<State>()) {
    state_->cancelled.store(is_cancelled, std::memory_order_release);
    state_->completion = std::move(completion);
}

bool CancellationToken::IsCancelled() const {
    return state_->cancelled.load(std::memory_order_acquire);
}

void CancellationToken::Cancel() const {
    Complete(CompletionReason::cancellation_requested);
}

bool CancellationToken::Complete(CompletionReason reason) const {
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    // Only the winner of the exchange gets here, so the handler is not shared.
    auto completion = std::move(state_->completion);
    state_->completion = nullptr;
    if (completion) {
        completion(reason);
    }
    return true;
}

} // namespace sixpn::discovery
