#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sixpn/core/status.h>

namespace sixpn::discovery {

// A logical service on the private network. Identity is (app_name, port);
// nearest is a resolution hint and takes no part in comparison or hashing.
struct Service {
    std::string app_name;
    std::uint16_t port = 0;
    std::uint32_t nearest = 1;

    Service() = default;
    Service(std::string app_name_, std::uint16_t port_, std::uint32_t nearest_ = 1)
        : app_name(std::move(app_name_)), port(port_), nearest(nearest_) {}

    bool operator==(const Service& o) const { return app_name == o.app_name && port == o.port; }
    bool operator!=(const Service& o) const { return !(*this == o); }

    // "name:port"
    std::string ToString() const;
};

struct ServiceHash {
    std::size_t operator()(const Service& s) const;
};

struct Instance {
    std::string host;
    std::uint16_t port = 0;

    bool operator==(const Instance& o) const { return host == o.host && port == o.port; }
    bool operator!=(const Instance& o) const { return !(*this == o); }

    // "[host]:port" for IPv6 literals, "host:port" otherwise
    std::string ToString() const;
};

std::string ToString(const std::vector<Instance>& instances);

// Parses "name:port[:nearest]".
Result<Service> ParseService(std::string_view text);

// Parses a comma separated list of ParseService() entries. Blank entries are skipped.
Result<std::vector<Service>> ParseServiceList(std::string_view text);

} // namespace sixpn::discovery
