#include <sixpn/discovery/service.h>

#include <charconv>
#include <functional>

namespace sixpn::discovery {
namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

template <class T>
bool ParseUnsigned(std::string_view s, T& out) {
    if (s.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

} // namespace

std::string Service::ToString() const {
    return app_name + ":" + std::to_string(port);
}

std::size_t ServiceHash::operator()(const Service& s) const {
    auto h = std::hash<std::string>{}(s.app_name);
    return h ^ (std::hash<std::uint16_t>{}(s.port) + 0x9e3779b9 + (h << 6) + (h >> 2));
}

std::string Instance::ToString() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

std::string ToString(const std::vector<Instance>& instances) {
    std::string out = "[";
    for (std::size_t i = 0; i < instances.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += instances[i].ToString();
    }
    out += "]";
    return out;
}

Result<Service> ParseService(std::string_view text) {
    text = Trim(text);
    auto first = text.find(':');
    if (first == std::string_view::npos || first == 0) {
        return Status(StatusCode::invalid_argument, "expected name:port[:nearest], got '" + std::string(text) + "'");
    }

    auto name = text.substr(0, first);
    auto rest = text.substr(first + 1);
    std::string_view nearest_sv;
    if (auto second = rest.find(':'); second != std::string_view::npos) {
        nearest_sv = rest.substr(second + 1);
        rest = rest.substr(0, second);
    }

    std::uint32_t port = 0;
    if (!ParseUnsigned(rest, port) || port == 0 || port > 65535) {
        return Status(StatusCode::invalid_argument, "invalid port in '" + std::string(text) + "'");
    }

    std::uint32_t nearest = 1;
    if (!nearest_sv.empty() && (!ParseUnsigned(nearest_sv, nearest) || nearest == 0)) {
        return Status(StatusCode::invalid_argument, "invalid nearest count in '" + std::string(text) + "'");
    }

    return Service(std::string(name), static_cast<std::uint16_t>(port), nearest);
}

Result<std::vector<Service>> ParseServiceList(std::string_view text) {
    std::vector<Service> out;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto part = Trim(comma == std::string_view::npos ? text : text.substr(0, comma));
        if (!part.empty()) {
            auto r = ParseService(part);
            if (!r.ok()) {
                return r.status();
            }
            out.push_back(std::move(r).value());
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return out;
}

} // namespace sixpn::discovery
