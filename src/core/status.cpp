#include <sixpn/core/status.h>

namespace sixpn {

std::string_view ToString(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::unknown_service: return "unknown_service";
        case StatusCode::timeout: return "timeout";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::cancelled: return "cancelled";
        case StatusCode::transport_error: return "transport_error";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

std::string Status::ToString() const {
    std::string out(sixpn::ToString(code_));
    if (!message_.empty()) {
        out += ": ";
        out += message_;
    }
    if (!details_.empty()) {
        out += " [";
        for (std::size_t i = 0; i < details_.size(); ++i) {
            if (i != 0) {
                out += ", ";
            }
            out += details_[i];
        }
        out += "]";
    }
    return out;
}

} // namespace sixpn
