#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <sixpn/config/config.h>
#include <sixpn/core/status.h>
#include <sixpn/discovery/service.h>
#include <sixpn/discovery/service_discovery.h>

namespace sixpn::config {

struct Settings {
    std::string log_level = "info";
    std::size_t io_threads = 0;

    discovery::DiscoveryOptions discovery;

    std::string dns_server; // empty: first nameserver of /etc/resolv.conf
    std::uint16_t dns_port = 53;
    std::chrono::milliseconds dns_timeout{5000};

    std::vector<discovery::Service> services;
};

// Keys absent from `cfg` keep their Settings{} default.
sixpn::Result<Settings> LoadSettings(const Config& cfg);

} // namespace sixpn::config
