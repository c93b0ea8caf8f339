#pragma once

#include <functional>
#include <string>
#include <vector>

#include <sixpn/core/status.h>
#include <sixpn/discovery/service.h>

namespace sixpn::dns {

using NamesHandler = std::function<void(sixpn::Result<std::vector<std::string>>)>;
using InstancesHandler = std::function<void(sixpn::Result<std::vector<discovery::Instance>>)>;

// Transport used by the discovery engine to reach the overlay's name service.
//
// Handlers may be invoked on any thread, possibly inline. Implementations must
// accept several outstanding calls at once.
class INameResolutionClient {
public:
    virtual ~INameResolutionClient() = default;

    // Every app name known to the private network.
    virtual void ListAllServiceNames(NamesHandler handler) = 0;

    // The service's nearest instances, at most service.nearest of them.
    virtual void ListInstancesOf(const discovery::Service& service, InstancesHandler handler) = 0;

    // Releases resources. Called exactly once, by the engine's shutdown.
    virtual void Close() = 0;
};

} // namespace sixpn::dns
