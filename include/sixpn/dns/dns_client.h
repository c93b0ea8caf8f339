#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <chlog/chlog.hpp>

#include <sixpn/dns/dns_message.h>
#include <sixpn/dns/name_resolution_client.h>

namespace sixpn::dns {

// The private network's internal resolver.
inline constexpr std::string_view kFallbackNameserver = "fdaa::3";
inline constexpr std::uint16_t kDnsPort = 53;

struct DnsClientOptions {
    boost::asio::ip::udp::endpoint server;
    std::chrono::milliseconds query_timeout{5000};
};

// First "nameserver" of a resolv.conf style file, or kFallbackNameserver.
boost::asio::ip::udp::endpoint DefaultNameserver(const std::string& resolv_conf = "/etc/resolv.conf");

sixpn::Result<boost::asio::ip::udp::endpoint> ParseNameserver(std::string_view host, std::uint16_t port);

// TXT record listing every app on the network.
std::string AppsQueryName();

// AAAA records of the service's nearest instances.
std::string NearestInstancesQueryName(const discovery::Service& service);

// Names from the TXT answer of an AppsQueryName() query.
sixpn::Result<std::vector<std::string>> AppNamesFromResponse(const Message& msg);

// Instances from the AAAA answers of a NearestInstancesQueryName() query.
sixpn::Result<std::vector<discovery::Instance>> InstancesFromResponse(const Message& msg, std::uint16_t port);

// INameResolutionClient over DNS/UDP.
//
// Thread-safe. Each query owns a socket and a timer; handlers run on the
// io_context the client was created with.
class LiveDnsClient final : public INameResolutionClient, public std::enable_shared_from_this<LiveDnsClient> {
public:
    LiveDnsClient(boost::asio::io_context& ioc, DnsClientOptions options, chlog::logger& logger);
    ~LiveDnsClient() override;

    LiveDnsClient(const LiveDnsClient&) = delete;
    LiveDnsClient& operator=(const LiveDnsClient&) = delete;

    void ListAllServiceNames(NamesHandler handler) override;
    void ListInstancesOf(const discovery::Service& service, InstancesHandler handler) override;

    // Cancels queries in flight; later queries fail as unavailable. Idempotent.
    void Close() override;

    const DnsClientOptions& options() const { return options_; }

private:
    class Query;
    using MessageHandler = std::function<void(sixpn::Result<Message>)>;

    void Send(std::string name, RecordType type, MessageHandler handler);
    void Forget(std::uint64_t key);

    boost::asio::io_context& ioc_;
    const DnsClientOptions options_;
    chlog::logger& logger_;

    std::mutex mu_;
    bool closed_ = false;
    std::uint64_t next_key_ = 0;
    std::unordered_map<std::uint64_t, std::weak_ptr<Query>> inflight_;
    std::mt19937 id_gen_;
};

} // namespace sixpn::dns
