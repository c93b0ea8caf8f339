#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include <sixpn/discovery/service.h>

namespace sixpn::discovery {

// Service -> last known instances. Presence of a key means "registered"; an
// empty sequence means "registered, not resolved yet".
//
// Not thread-safe: confined to the engine's strand.
class ServiceRegistry {
public:
    // Inserts the service, or resets an existing entry to empty. The stored key
    // takes the latest nearest hint.
    void Register(const Service& service);

    bool Contains(const Service& service) const;

    // nullptr when not registered.
    const std::vector<Instance>* Find(const Service& service) const;

    // Replaces the instances of a registered service. Returns true when the
    // sequence differs from the stored one (order-sensitive); unregistered
    // services are ignored.
    bool Update(const Service& service, std::vector<Instance> instances);

    std::vector<Service> Services() const;

    std::size_t size() const { return entries_.size(); }

private:
    std::unordered_map<Service, std::vector<Instance>, ServiceHash> entries_;
};

} // namespace sixpn::discovery
