#include <sixpn/discovery/subscription_registry.h>

#include <algorithm>

namespace sixpn::discovery {

void SubscriptionRegistry::Add(const Service& service, NextHandler on_next, CancellationToken token) {
    subscriptions_[service].push_back(Subscription{std::move(on_next), std::move(token)});
}

std::size_t SubscriptionRegistry::Notify(const Service& service, const InstancesResult& result) {
    auto it = subscriptions_.find(service);
    if (it == subscriptions_.end()) {
        return 0;
    }

    // Copy first: a handler may add to or sweep this list.
    auto targets = it->second;
    std::size_t delivered = 0;
    for (auto& sub : targets) {
        if (sub.token.IsCancelled()) {
            continue;
        }
        sub.on_next(result);
        ++delivered;
    }
    return delivered;
}

std::size_t SubscriptionRegistry::CompleteAll(CompletionReason reason) {
    std::vector<CancellationToken> tokens;
    for (const auto& [service, subs] : subscriptions_) {
        for (const auto& sub : subs) {
            tokens.push_back(sub.token);
        }
    }

    std::size_t completed = 0;
    for (const auto& token : tokens) {
        if (token.Complete(reason)) {
            ++completed;
        }
    }
    return completed;
}

bool SubscriptionRegistry::Complete(const CancellationToken& token, CompletionReason reason) {
    return token.Complete(reason);
}

std::size_t SubscriptionRegistry::Sweep() {
    std::size_t removed = 0;
    for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
        auto& subs = it->second;
        auto keep = std::remove_if(subs.begin(), subs.end(), [](const Subscription& s) {
            return s.token.IsCancelled();
        });
        removed += static_cast<std::size_t>(subs.end() - keep);
        subs.erase(keep, subs.end());

        if (subs.empty()) {
            it = subscriptions_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t SubscriptionRegistry::size() const {
    std::size_t total = 0;
    for (const auto& [service, subs] : subscriptions_) {
        total += subs.size();
    }
    return total;
}

} // namespace sixpn::discovery
