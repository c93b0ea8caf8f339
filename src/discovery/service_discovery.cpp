#include <sixpn/discovery/service_discovery.h>

#include <future>

namespace sixpn::discovery {

sixpn::Status RegisterAndWait(IServiceDiscovery& discovery, std::vector<Service> services) {
    auto promise = std::make_shared<std::promise<sixpn::Status>>();
    auto future = promise->get_future();
    discovery.Register(std::move(services), [promise](sixpn::Status st) {
        promise->set_value(std::move(st));
    });
    return future.get();
}

InstancesResult LookupAndWait(IServiceDiscovery& discovery, const Service& service, std::optional<Deadline> deadline) {
    auto promise = std::make_shared<std::promise<InstancesResult>>();
    auto future = promise->get_future();
    discovery.Lookup(service, deadline, [promise](InstancesResult r) {
        promise->set_value(std::move(r));
    });
    return future.get();
}

void ShutdownAndWait(IServiceDiscovery& discovery) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    discovery.Shutdown([promise](const sixpn::Status&) {
        promise->set_value();
    });
    future.get();
}

} // namespace sixpn::discovery
