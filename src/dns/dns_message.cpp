#include <sixpn/dns/dns_message.h>

#include <algorithm>
#include <cstddef>

namespace sixpn::dns {
namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxLabel = 63;
constexpr std::size_t kMaxName = 255;
constexpr int kMaxPointerJumps = 16;

sixpn::Status Malformed(std::string what) {
    return sixpn::Status(sixpn::StatusCode::transport_error, "malformed dns message: " + std::move(what));
}

void PutU16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> bytes) : bytes_(bytes) {}

    std::size_t pos() const { return pos_; }
    std::size_t remaining() const { return bytes_.size() - pos_; }

    bool U16(std::uint16_t& out) {
        if (remaining() < 2) {
            return false;
        }
        out = static_cast<std::uint16_t>((bytes_[pos_] << 8) | bytes_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    bool U32(std::uint32_t& out) {
        std::uint16_t hi = 0;
        std::uint16_t lo = 0;
        if (!U16(hi) || !U16(lo)) {
            return false;
        }
        out = (static_cast<std::uint32_t>(hi) << 16) | lo;
        return true;
    }

    bool Bytes(std::size_t n, std::vector<std::uint8_t>& out) {
        if (remaining() < n) {
            return false;
        }
        out.assign(bytes_.begin() + static_cast<std::ptrdiff_t>(pos_),
                   bytes_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
        pos_ += n;
        return true;
    }

    // Reads a possibly compressed name; the cursor ends after the name as it
    // appears at the current position.
    sixpn::Status Name(std::string& out) {
        out.clear();
        std::size_t cursor = pos_;
        std::size_t resume = 0;
        bool jumped = false;
        int jumps = 0;

        while (true) {
            if (cursor >= bytes_.size()) {
                return Malformed("name runs past end");
            }
            std::uint8_t len = bytes_[cursor];

            if ((len & 0xC0) == 0xC0) {
                if (cursor + 1 >= bytes_.size()) {
                    return Malformed("truncated compression pointer");
                }
                if (++jumps > kMaxPointerJumps) {
                    return Malformed("compression pointer loop");
                }
                std::size_t target = (static_cast<std::size_t>(len & 0x3F) << 8) | bytes_[cursor + 1];
                if (!jumped) {
                    resume = cursor + 2;
                    jumped = true;
                }
                cursor = target;
                continue;
            }
            if ((len & 0xC0) != 0) {
                return Malformed("unsupported label type");
            }

            ++cursor;
            if (len == 0) {
                break;
            }
            if (cursor + len > bytes_.size()) {
                return Malformed("label runs past end");
            }
            if (!out.empty()) {
                out.push_back('.');
            }
            auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(cursor);
            out.append(first, first + static_cast<std::ptrdiff_t>(len));
            if (out.size() > kMaxName) {
                return Malformed("name too long");
            }
            cursor += len;
        }

        pos_ = jumped ? resume : cursor;
        return sixpn::Status::Ok();
    }

private:
    std::span<const std::uint8_t> bytes_;
    std::size_t pos_ = 0;
};

} // namespace

sixpn::Result<std::vector<std::uint8_t>> EncodeQuery(std::uint16_t id, std::string_view name, RecordType type) {
    if (!name.empty() && name.back() == '.') {
        name.remove_suffix(1);
    }
    if (name.empty() || name.size() > kMaxName) {
        return sixpn::Status(sixpn::StatusCode::invalid_argument, "invalid query name");
    }

    std::vector<std::uint8_t> out;
    out.reserve(kHeaderSize + name.size() + 6);

    PutU16(out, id);
    PutU16(out, 0x0100); // RD
    PutU16(out, 1);      // QDCOUNT
    PutU16(out, 0);
    PutU16(out, 0);
    PutU16(out, 0);

    while (!name.empty()) {
        auto dot = name.find('.');
        auto label = name.substr(0, dot);
        if (label.empty() || label.size() > kMaxLabel) {
            return sixpn::Status(sixpn::StatusCode::invalid_argument, "invalid label in query name");
        }
        out.push_back(static_cast<std::uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
        if (dot == std::string_view::npos) {
            break;
        }
        name.remove_prefix(dot + 1);
    }
    out.push_back(0);

    PutU16(out, static_cast<std::uint16_t>(type));
    PutU16(out, kClassIn);
    return out;
}

sixpn::Result<Message> ParseMessage(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < kHeaderSize) {
        return Malformed("short header");
    }

    Reader r(bytes);
    Message msg;
    std::uint16_t qdcount = 0;
    std::uint16_t ancount = 0;
    std::uint16_t nscount = 0;
    std::uint16_t arcount = 0;
    r.U16(msg.id);
    r.U16(msg.flags);
    r.U16(qdcount);
    r.U16(ancount);
    r.U16(nscount);
    r.U16(arcount);

    std::string name;
    for (std::uint16_t i = 0; i < qdcount; ++i) {
        if (auto st = r.Name(name); !st.ok()) {
            return st;
        }
        std::uint16_t qtype = 0;
        std::uint16_t qclass = 0;
        if (!r.U16(qtype) || !r.U16(qclass)) {
            return Malformed("truncated question");
        }
    }

    msg.answers.reserve(ancount);
    for (std::uint16_t i = 0; i < ancount; ++i) {
        ResourceRecord rr;
        if (auto st = r.Name(rr.name); !st.ok()) {
            return st;
        }
        std::uint16_t rdlength = 0;
        if (!r.U16(rr.type) || !r.U16(rr.klass) || !r.U32(rr.ttl) || !r.U16(rdlength)) {
            return Malformed("truncated resource record");
        }
        if (!r.Bytes(rdlength, rr.data)) {
            return Malformed("truncated rdata");
        }
        msg.answers.push_back(std::move(rr));
    }

    return msg;
}

sixpn::Result<std::vector<std::string>> TxtStrings(const ResourceRecord& rr) {
    if (!rr.Is(RecordType::txt)) {
        return sixpn::Status(sixpn::StatusCode::transport_error, "not a TXT record");
    }

    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < rr.data.size()) {
        std::size_t len = rr.data[i++];
        if (i + len > rr.data.size()) {
            return Malformed("TXT string runs past rdata");
        }
        auto first = rr.data.begin() + static_cast<std::ptrdiff_t>(i);
        out.emplace_back(first, first + static_cast<std::ptrdiff_t>(len));
        i += len;
    }
    return out;
}

sixpn::Result<boost::asio::ip::address_v6> AaaaAddress(const ResourceRecord& rr) {
    if (!rr.Is(RecordType::aaaa)) {
        return sixpn::Status(sixpn::StatusCode::transport_error, "not an AAAA record");
    }
    boost::asio::ip::address_v6::bytes_type raw{};
    if (rr.data.size() != raw.size()) {
        return Malformed("AAAA rdata must be 16 bytes");
    }
    std::copy(rr.data.begin(), rr.data.end(), raw.begin());
    return boost::asio::ip::address_v6(raw);
}

std::string_view RcodeName(int rcode) {
    switch (rcode) {
        case 0: return "NOERROR";
        case 1: return "FORMERR";
        case 2: return "SERVFAIL";
        case 3: return "NXDOMAIN";
        case 4: return "NOTIMP";
        case 5: return "REFUSED";
    }
    return "RCODE";
}

} // namespace sixpn::dns
