#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <vector>

#include <sixpn/core/status.h>
#include <sixpn/discovery/cancellation_token.h>
#include <sixpn/discovery/service.h>
#include <sixpn/discovery/subscription_registry.h>

namespace sixpn::discovery {

using Deadline = std::chrono::steady_clock::time_point;
using LookupCallback = std::function<void(InstancesResult)>;
using StatusCallback = std::function<void(sixpn::Status)>;

struct DiscoveryOptions {
    std::chrono::milliseconds default_lookup_timeout{1000};
    std::chrono::milliseconds refresh_interval{std::chrono::minutes(1)};
    std::chrono::milliseconds cleanup_interval{std::chrono::minutes(1)};
};

class IServiceDiscovery {
public:
    virtual ~IServiceDiscovery() = default;

    virtual std::chrono::milliseconds DefaultLookupTimeout() const = 0;

    // Thread-safe. All or nothing: on not_found, status().details() lists the
    // requested names the network does not know and nothing is registered.
    virtual void Register(std::vector<Service> services, StatusCallback done) = 0;

    // Thread-safe. `callback` runs exactly once.
    virtual void Lookup(const Service& service, std::optional<Deadline> deadline, LookupCallback callback) = 0;

    // Thread-safe. `on_next` gets the current instances once, then every change
    // until the token is cancelled or discovery shuts down; `on_complete` runs
    // exactly once at the end.
    virtual CancellationToken Subscribe(const Service& service, NextHandler on_next, CompletionHandler on_complete = {}) = 0;

    // Thread-safe, idempotent.
    virtual void Shutdown(StatusCallback done = {}) = 0;

    // Thread-safe
    virtual bool IsShutdown() const = 0;
};

// Blocking wrappers. Must not be called from the thread running the
// discovery's io_context.
sixpn::Status RegisterAndWait(IServiceDiscovery& discovery, std::vector<Service> services);
InstancesResult LookupAndWait(IServiceDiscovery& discovery, const Service& service,
                              std::optional<Deadline> deadline = std::nullopt);
void ShutdownAndWait(IServiceDiscovery& discovery);

} // namespace sixpn::discovery
