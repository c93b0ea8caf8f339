#include <chtest.hpp>

#include <sixpn/core/log.h>
#include <sixpn/dns/dns_client.h>
#include <sixpn/dns/dns_message.h>

#include <array>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

using sixpn::StatusCode;
using sixpn::discovery::Instance;
using sixpn::discovery::Service;
using sixpn::dns::Message;
using sixpn::dns::RecordType;
using sixpn::dns::ResourceRecord;

namespace {

using namespace std::chrono_literals;

void PutU16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

// Answers echo the question and name it with a pointer to offset 12.
std::vector<std::uint8_t> Response(const std::vector<std::uint8_t>& query, std::uint16_t flags,
                                   const std::vector<std::pair<RecordType, std::vector<std::uint8_t>>>& answers) {
    std::vector<std::uint8_t> out(query.begin(), query.end());
    out[2] = static_cast<std::uint8_t>(flags >> 8);
    out[3] = static_cast<std::uint8_t>(flags & 0xFF);
    out[6] = 0;
    out[7] = static_cast<std::uint8_t>(answers.size());

    for (const auto& [type, rdata] : answers) {
        out.push_back(0xC0);
        out.push_back(12);
        PutU16(out, static_cast<std::uint16_t>(type));
        PutU16(out, sixpn::dns::kClassIn);
        PutU16(out, 0);
        PutU16(out, 30);
        PutU16(out, static_cast<std::uint16_t>(rdata.size()));
        out.insert(out.end(), rdata.begin(), rdata.end());
    }
    return out;
}

std::vector<std::uint8_t> Txt(const std::string& s) {
    std::vector<std::uint8_t> out;
    out.push_back(static_cast<std::uint8_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
    return out;
}

std::vector<std::uint8_t> Aaaa(const std::string& addr) {
    auto bytes = boost::asio::ip::make_address_v6(addr).to_bytes();
    return std::vector<std::uint8_t>(bytes.begin(), bytes.end());
}

Message Parsed(const std::vector<std::uint8_t>& bytes) {
    auto r = sixpn::dns::ParseMessage(bytes);
    if (!r.ok()) {
        throw std::runtime_error(r.status().ToString());
    }
    return std::move(r).value();
}

} // namespace

TEST_CASE("EncodeQuery writes a recursive single question") {
    auto q = sixpn::dns::EncodeQuery(0xBEEF, "_apps.internal.", RecordType::txt);
    REQUIRE(q.ok());
    const auto& b = q.value();

    REQUIRE(b[0] == 0xBE);
    REQUIRE(b[1] == 0xEF);
    REQUIRE(b[2] == 0x01);
    REQUIRE(b[5] == 1);
    REQUIRE(b[12] == 5);
    REQUIRE(std::string(b.begin() + 13, b.begin() + 18) == "_apps");
    REQUIRE(b[18] == 8);
    REQUIRE(b[27] == 0);
    REQUIRE(b[29] == 16);
    REQUIRE(b.size() == 32);
}

TEST_CASE("EncodeQuery rejects empty names and oversized labels") {
    REQUIRE(sixpn::dns::EncodeQuery(1, "", RecordType::a).status().code() == StatusCode::invalid_argument);
    REQUIRE(sixpn::dns::EncodeQuery(1, "a..b", RecordType::a).status().code() == StatusCode::invalid_argument);
    REQUIRE(sixpn::dns::EncodeQuery(1, std::string(64, 'x') + ".internal", RecordType::a).status().code() ==
            StatusCode::invalid_argument);
}

TEST_CASE("ParseMessage follows compression pointers in answers") {
    auto q = sixpn::dns::EncodeQuery(7, "top2.nearest.of.web.internal", RecordType::aaaa).value();
    auto msg = Parsed(Response(q, 0x8180, {{RecordType::aaaa, Aaaa("fdaa::1")}, {RecordType::aaaa, Aaaa("fdaa::2")}}));

    REQUIRE(msg.id == 7);
    REQUIRE(msg.IsResponse());
    REQUIRE(msg.Rcode() == 0);
    REQUIRE(msg.answers.size() == 2);
    REQUIRE(msg.answers[0].name == "top2.nearest.of.web.internal");
    REQUIRE(msg.answers[1].ttl == 30);
    REQUIRE(sixpn::dns::AaaaAddress(msg.answers[1]).value().to_string() == "fdaa::2");
}

TEST_CASE("ParseMessage rejects truncated and looping input") {
    std::vector<std::uint8_t> short_header{0, 1, 0x81};
    REQUIRE(sixpn::dns::ParseMessage(short_header).status().code() == StatusCode::transport_error);

    auto q = sixpn::dns::EncodeQuery(7, "web.internal", RecordType::aaaa).value();
    auto full = Response(q, 0x8180, {{RecordType::aaaa, Aaaa("fdaa::1")}});
    full.resize(full.size() - 4);
    REQUIRE(sixpn::dns::ParseMessage(full).status().code() == StatusCode::transport_error);

    // The question name points at itself.
    std::vector<std::uint8_t> loop{0, 1, 0x81, 0x80, 0, 1, 0, 0, 0, 0, 0, 0, 0xC0, 12, 0, 1, 0, 1};
    auto r = sixpn::dns::ParseMessage(loop);
    REQUIRE(!r.ok());
    REQUIRE(r.status().message().find("loop") != std::string::npos);
}

TEST_CASE("TxtStrings splits character strings") {
    ResourceRecord rr;
    rr.type = static_cast<std::uint16_t>(RecordType::txt);
    rr.data = Txt("web,db");
    auto more = Txt("queue");
    rr.data.insert(rr.data.end(), more.begin(), more.end());

    auto r = sixpn::dns::TxtStrings(rr);
    REQUIRE(r.ok());
    REQUIRE(r.value() == std::vector<std::string>{"web,db", "queue"});

    rr.data.push_back(9);
    REQUIRE(!sixpn::dns::TxtStrings(rr).ok());
}

TEST_CASE("AppNamesFromResponse reads the comma list of the first TXT answer") {
    auto q = sixpn::dns::EncodeQuery(1, sixpn::dns::AppsQueryName(), RecordType::txt).value();

    auto names = sixpn::dns::AppNamesFromResponse(Parsed(Response(q, 0x8180, {{RecordType::txt, Txt("web,,db,")}})));
    REQUIRE(names.ok());
    REQUIRE(names.value() == std::vector<std::string>{"web", "db"});

    auto none = sixpn::dns::AppNamesFromResponse(Parsed(Response(q, 0x8180, {})));
    REQUIRE(none.status().code() == StatusCode::transport_error);
    REQUIRE(none.status().message() == "dns response had no answers");

    auto wrong = sixpn::dns::AppNamesFromResponse(Parsed(Response(q, 0x8180, {{RecordType::aaaa, Aaaa("fdaa::1")}})));
    REQUIRE(wrong.status().message() == "first dns answer is not a TXT record");

    auto nx = sixpn::dns::AppNamesFromResponse(Parsed(Response(q, 0x8183, {})));
    REQUIRE(nx.status().message().find("NXDOMAIN") != std::string::npos);
}

TEST_CASE("InstancesFromResponse keeps AAAA answers in order with the service port") {
    Service svc("web", 8080, 2);
    REQUIRE(sixpn::dns::NearestInstancesQueryName(svc) == "top2.nearest.of.web.internal");

    auto q = sixpn::dns::EncodeQuery(1, sixpn::dns::NearestInstancesQueryName(svc), RecordType::aaaa).value();
    auto msg = Parsed(Response(q, 0x8180, {{RecordType::aaaa, Aaaa("fdaa::b")},
                                           {RecordType::txt, Txt("ignored")},
                                           {RecordType::aaaa, Aaaa("fdaa::a")}}));
    auto r = sixpn::dns::InstancesFromResponse(msg, svc.port);
    REQUIRE(r.ok());
    REQUIRE(r.value() == std::vector<Instance>{{"fdaa::b", 8080}, {"fdaa::a", 8080}});
}

TEST_CASE("InstancesFromResponse treats NXDOMAIN and AAAA-less answers as no instances") {
    Service svc("idle", 9000);
    auto q = sixpn::dns::EncodeQuery(1, sixpn::dns::NearestInstancesQueryName(svc), RecordType::aaaa).value();

    auto nx = sixpn::dns::InstancesFromResponse(Parsed(Response(q, 0x8183, {})), svc.port);
    REQUIRE(nx.ok());
    REQUIRE(nx.value().empty());

    auto no_aaaa = sixpn::dns::InstancesFromResponse(Parsed(Response(q, 0x8180, {{RecordType::txt, Txt("x")}})), svc.port);
    REQUIRE(no_aaaa.ok());
    REQUIRE(no_aaaa.value().empty());

    // Other failures still surface.
    auto servfail = sixpn::dns::InstancesFromResponse(Parsed(Response(q, 0x8182, {})), svc.port);
    REQUIRE(servfail.status().code() == StatusCode::transport_error);
    REQUIRE(servfail.status().message().find("SERVFAIL") != std::string::npos);

    auto truncated = sixpn::dns::InstancesFromResponse(Parsed(Response(q, 0x8383, {})), svc.port);
    REQUIRE(truncated.status().code() == StatusCode::transport_error);
}

TEST_CASE("DefaultNameserver reads resolv.conf and falls back to the overlay resolver") {
    std::string path = "sixpn_test_resolv.conf";
    {
        std::ofstream out(path);
        out << "# comment\nsearch internal\nnameserver fdaa:0:1::3\nnameserver 10.0.0.1\n";
    }
    auto ep = sixpn::dns::DefaultNameserver(path);
    REQUIRE(ep.address().to_string() == "fdaa:0:1::3");
    REQUIRE(ep.port() == 53);
    std::remove(path.c_str());

    auto fallback = sixpn::dns::DefaultNameserver("does/not/exist.conf");
    REQUIRE(fallback.address().to_string() == "fdaa::3");

    REQUIRE(sixpn::dns::ParseNameserver("not-an-ip", 53).status().code() == StatusCode::invalid_argument);
}

TEST_CASE("LiveDnsClient queries a nameserver over UDP") {
    using udp = boost::asio::ip::udp;

    boost::asio::io_context ioc;
    udp::socket server(ioc, udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    std::array<std::uint8_t, 512> buf{};
    udp::endpoint peer;
    std::function<void()> serve = [&] {
        server.async_receive_from(boost::asio::buffer(buf), peer, [&](const boost::system::error_code& ec, std::size_t n) {
            if (ec) {
                return;
            }
            std::vector<std::uint8_t> query(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
            bool apps = query[query.size() - 3] == static_cast<std::uint8_t>(RecordType::txt);
            auto reply = apps ? Response(query, 0x8180, {{RecordType::txt, Txt("web,db")}})
                              : Response(query, 0x8180, {{RecordType::aaaa, Aaaa("fdaa::7")}});
            server.send_to(boost::asio::buffer(reply), peer);
            serve();
        });
    };
    serve();

    auto logger = sixpn::log::Create("dns-test", "warn");
    sixpn::dns::DnsClientOptions opt;
    opt.server = server.local_endpoint();
    opt.query_timeout = 2000ms;
    auto client = std::make_shared<sixpn::dns::LiveDnsClient>(ioc, opt, *logger);

    sixpn::Result<std::vector<std::string>> names = sixpn::Status(StatusCode::internal_error, "unset");
    sixpn::Result<std::vector<Instance>> instances = sixpn::Status(StatusCode::internal_error, "unset");
    int pending = 2;
    client->ListAllServiceNames([&](sixpn::Result<std::vector<std::string>> r) {
        names = std::move(r);
        if (--pending == 0) {
            server.close();
        }
    });
    client->ListInstancesOf(Service("web", 80), [&](sixpn::Result<std::vector<Instance>> r) {
        instances = std::move(r);
        if (--pending == 0) {
            server.close();
        }
    });
    ioc.run_for(5s);

    REQUIRE(names.ok());
    REQUIRE(names.value() == std::vector<std::string>{"web", "db"});
    REQUIRE(instances.ok());
    REQUIRE(instances.value() == std::vector<Instance>{{"fdaa::7", 80}});
    client->Close();
}

TEST_CASE("LiveDnsClient times out, and fails as unavailable once closed") {
    using udp = boost::asio::ip::udp;

    boost::asio::io_context ioc;
    // Bound but never read: queries go unanswered.
    udp::socket silent(ioc, udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    auto logger = sixpn::log::Create("dns-test", "error");
    sixpn::dns::DnsClientOptions opt;
    opt.server = silent.local_endpoint();
    opt.query_timeout = 50ms;
    auto client = std::make_shared<sixpn::dns::LiveDnsClient>(ioc, opt, *logger);

    sixpn::Result<std::vector<std::string>> first = sixpn::Status(StatusCode::internal_error, "unset");
    client->ListAllServiceNames([&](sixpn::Result<std::vector<std::string>> r) { first = std::move(r); });
    ioc.run_for(2s);
    REQUIRE(first.status().code() == StatusCode::timeout);

    client->Close();
    client->Close();
    sixpn::Result<std::vector<std::string>> after = sixpn::Status(StatusCode::internal_error, "unset");
    client->ListAllServiceNames([&](sixpn::Result<std::vector<std::string>> r) { after = std::move(r); });
    REQUIRE(after.status().code() == StatusCode::unavailable);
}
