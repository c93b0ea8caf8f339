#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

#include <sixpn/core/status.h>
#include <sixpn/discovery/cancellation_token.h>
#include <sixpn/discovery/service.h>

namespace sixpn::discovery {

using InstancesResult = sixpn::Result<std::vector<Instance>>;
using NextHandler = std::function<void(InstancesResult)>;

// Active subscriptions per service.
//
// Not thread-safe: confined to the engine's strand. Handlers are called with
// no registry iteration in progress, so they may subscribe or cancel.
class SubscriptionRegistry {
public:
    void Add(const Service& service, NextHandler on_next, CancellationToken token);

    // Delivers `result` to every subscription of `service` not cancelled at
    // the time of its call. Returns the number of deliveries.
    std::size_t Notify(const Service& service, const InstancesResult& result);

    // Completes every subscription not already completed. Entries are kept.
    std::size_t CompleteAll(CompletionReason reason);

    // Completes a token that never made it into the registry.
    static bool Complete(const CancellationToken& token, CompletionReason reason);

    // Drops cancelled subscriptions and services left without any.
    std::size_t Sweep();

    std::size_t size() const;

private:
    struct Subscription {
        NextHandler on_next;
        CancellationToken token;
    };

    std::unordered_map<Service, std::vector<Subscription>, ServiceHash> subscriptions_;
};

} // namespace sixpn::discovery
