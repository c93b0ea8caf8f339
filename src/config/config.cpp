#include <sixpn/config/config.h>

#include <fstream>
#include <sstream>

namespace sixpn::config {

namespace {

const char* ErrorCodeToString(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "ok";
        case chjson::error_code::unexpected_eof: return "unexpected_eof";
        case chjson::error_code::invalid_value: return "invalid_value";
        case chjson::error_code::invalid_number: return "invalid_number";
        case chjson::error_code::invalid_string: return "invalid_string";
        case chjson::error_code::invalid_escape: return "invalid_escape";
        case chjson::error_code::invalid_unicode_escape: return "invalid_unicode_escape";
        case chjson::error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
        case chjson::error_code::expected_colon: return "expected_colon";
        case chjson::error_code::expected_comma_or_end: return "expected_comma_or_end";
        case chjson::error_code::expected_key_string: return "expected_key_string";
        case chjson::error_code::trailing_characters: return "trailing_characters";
        case chjson::error_code::nesting_too_deep: return "nesting_too_deep";
        case chjson::error_code::out_of_memory: return "out_of_memory";
    }
    return "unknown";
}

sixpn::Status InvalidKey(std::string_view key, std::string_view what) {
    return sixpn::Status(sixpn::StatusCode::invalid_argument, "config key '" + std::string(key) + "' " + std::string(what));
}

} // namespace

sixpn::Result<Config> Config::LoadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return sixpn::Status(sixpn::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return Parse(ss.str());
}

sixpn::Result<Config> Config::Parse(std::string_view text) {
    std::string owned(text);
    auto r = chjson::parse(owned);
    if (r.err) {
        std::ostringstream oss;
        oss << "invalid json: " << ErrorCodeToString(r.err.code)
            << " at line " << r.err.line << ", col " << r.err.column;
        return sixpn::Status(sixpn::StatusCode::invalid_argument, oss.str());
    }
    if (!r.doc.root().is_object()) {
        return sixpn::Status(sixpn::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

bool Config::Has(std::string_view key) const {
    return doc_.root().find(key) != nullptr;
}

sixpn::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return sixpn::Status(sixpn::StatusCode::not_found, "missing config key '" + std::string(key) + "'");
    }
    if (!v->is_string()) {
        return InvalidKey(key, "is not a string");
    }
    return std::string(v->as_string_view());
}

sixpn::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return sixpn::Status(sixpn::StatusCode::not_found, "missing config key '" + std::string(key) + "'");
    }
    if (!v->is_number() || !v->is_int()) {
        return InvalidKey(key, "is not an int");
    }
    return static_cast<int>(v->as_int());
}

sixpn::Result<std::string> Config::GetString(std::string_view key, std::string def) const {
    if (!Has(key)) {
        return def;
    }
    return GetString(key);
}

sixpn::Result<int> Config::GetInt(std::string_view key, int def) const {
    if (!Has(key)) {
        return def;
    }
    return GetInt(key);
}

} // namespace sixpn::config
