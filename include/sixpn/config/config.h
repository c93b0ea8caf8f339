#pragma once

#include <string>
#include <string_view>

#include <sixpn/core/status.h>

#include <chjson/chjson.hpp>

namespace sixpn::config {

// A flat JSON object of settings.
class Config {
public:
    static sixpn::Result<Config> LoadFile(const std::string& path);
    static sixpn::Result<Config> Parse(std::string_view text);

    bool Has(std::string_view key) const;

    sixpn::Result<std::string> GetString(std::string_view key) const;
    sixpn::Result<int> GetInt(std::string_view key) const;

    // Missing keys yield `def`; present keys of the wrong type are errors.
    sixpn::Result<std::string> GetString(std::string_view key, std::string def) const;
    sixpn::Result<int> GetInt(std::string_view key, int def) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    chjson::document doc_;
};

} // namespace sixpn::config
