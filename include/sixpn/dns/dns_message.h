#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/ip/address_v6.hpp>

#include <sixpn/core/status.h>

namespace sixpn::dns {

enum class RecordType : std::uint16_t {
    a = 1,
    txt = 16,
    aaaa = 28,
};

constexpr std::uint16_t kClassIn = 1;

struct ResourceRecord {
    std::string name;
    std::uint16_t type = 0;
    std::uint16_t klass = 0;
    std::uint32_t ttl = 0;
    std::vector<std::uint8_t> data;

    bool Is(RecordType t) const { return type == static_cast<std::uint16_t>(t); }
};

struct Message {
    std::uint16_t id = 0;
    std::uint16_t flags = 0;
    std::vector<ResourceRecord> answers;

    bool IsResponse() const { return (flags & 0x8000) != 0; }
    bool Truncated() const { return (flags & 0x0200) != 0; }
    int Rcode() const { return flags & 0x000F; }
};

// Recursive query with a single IN question.
sixpn::Result<std::vector<std::uint8_t>> EncodeQuery(std::uint16_t id, std::string_view name, RecordType type);

// Header and answer section; questions are skipped, authority and additional ignored.
sixpn::Result<Message> ParseMessage(std::span<const std::uint8_t> bytes);

// The character-strings of a TXT record's RDATA.
sixpn::Result<std::vector<std::string>> TxtStrings(const ResourceRecord& rr);

sixpn::Result<boost::asio::ip::address_v6> AaaaAddress(const ResourceRecord& rr);

std::string_view RcodeName(int rcode);

} // namespace sixpn::dns
