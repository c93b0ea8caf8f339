#include <sixpn/config/settings.h>

#include <string_view>
#include <utility>

namespace sixpn::config {
namespace {

sixpn::Status ReadPositiveMillis(const Config& cfg, std::string_view key, std::chrono::milliseconds& out) {
    auto r = cfg.GetInt(key, static_cast<int>(out.count()));
    if (!r.ok()) {
        return r.status();
    }
    if (r.value() <= 0) {
        return sixpn::Status(sixpn::StatusCode::invalid_argument, "config key '" + std::string(key) + "' must be > 0");
    }
    out = std::chrono::milliseconds(r.value());
    return sixpn::Status::Ok();
}

} // namespace

sixpn::Result<Settings> LoadSettings(const Config& cfg) {
    Settings s;

    auto level = cfg.GetString("log_level", s.log_level);
    if (!level.ok()) {
        return level.status();
    }
    s.log_level = std::move(level).value();

    auto threads = cfg.GetInt("io_threads", 0);
    if (!threads.ok()) {
        return threads.status();
    }
    if (threads.value() < 0) {
        return sixpn::Status(sixpn::StatusCode::invalid_argument, "config key 'io_threads' must be >= 0");
    }
    s.io_threads = static_cast<std::size_t>(threads.value());

    const std::pair<std::string_view, std::chrono::milliseconds*> durations[] = {
        {"lookup_timeout_ms", &s.discovery.default_lookup_timeout},
        {"refresh_interval_ms", &s.discovery.refresh_interval},
        {"cleanup_interval_ms", &s.discovery.cleanup_interval},
        {"dns_timeout_ms", &s.dns_timeout},
    };
    for (const auto& [key, field] : durations) {
        if (auto st = ReadPositiveMillis(cfg, key, *field); !st.ok()) {
            return st;
        }
    }

    auto server = cfg.GetString("dns_server", "");
    if (!server.ok()) {
        return server.status();
    }
    s.dns_server = std::move(server).value();

    auto port = cfg.GetInt("dns_port", s.dns_port);
    if (!port.ok()) {
        return port.status();
    }
    if (port.value() <= 0 || port.value() > 65535) {
        return sixpn::Status(sixpn::StatusCode::invalid_argument, "config key 'dns_port' is not a valid port");
    }
    s.dns_port = static_cast<std::uint16_t>(port.value());

    auto services = cfg.GetString("services", "");
    if (!services.ok()) {
        return services.status();
    }
    auto parsed = discovery::ParseServiceList(services.value());
    if (!parsed.ok()) {
        return parsed.status();
    }
    s.services = std::move(parsed).value();

    return s;
}

} // namespace sixpn::config
