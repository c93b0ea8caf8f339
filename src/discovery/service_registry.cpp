#include <sixpn/discovery/service_registry.h>

namespace sixpn::discovery {

void ServiceRegistry::Register(const Service& service) {
    entries_.erase(service);
    entries_.emplace(service, std::vector<Instance>{});
}

bool ServiceRegistry::Contains(const Service& service) const {
    return entries_.find(service) != entries_.end();
}

const std::vector<Instance>* ServiceRegistry::Find(const Service& service) const {
    auto it = entries_.find(service);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ServiceRegistry::Update(const Service& service, std::vector<Instance> instances) {
    auto it = entries_.find(service);
    if (it == entries_.end()) {
        return false;
    }
    if (it->second == instances) {
        return false;
    }
    it->second = std::move(instances);
    return true;
}

std::vector<Service> ServiceRegistry::Services() const {
    std::vector<Service> out;
    out.reserve(entries_.size());
    for (const auto& [service, instances] : entries_) {
        out.push_back(service);
    }
    return out;
}

} // namespace sixpn::discovery
