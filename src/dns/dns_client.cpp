#include <sixpn/dns/dns_client.h>

#include <array>
#include <fstream>
#include <sstream>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace sixpn::dns {
namespace {

using udp = boost::asio::ip::udp;

constexpr std::size_t kMaxUdpPayload = 4096;
constexpr int kRcodeNameError = 3;

sixpn::Status FromErrorCode(std::string_view what, const boost::system::error_code& ec) {
    return sixpn::Status(sixpn::StatusCode::transport_error, std::string(what) + ": " + ec.message());
}

sixpn::Status CheckRcode(const Message& msg) {
    if (msg.Rcode() != 0) {
        return sixpn::Status(sixpn::StatusCode::transport_error,
                             "dns query failed: " + std::string(RcodeName(msg.Rcode())));
    }
    if (msg.Truncated()) {
        return sixpn::Status(sixpn::StatusCode::transport_error, "dns response truncated");
    }
    return sixpn::Status::Ok();
}

} // namespace

class LiveDnsClient::Query : public std::enable_shared_from_this<LiveDnsClient::Query> {
public:
    Query(boost::asio::io_context& ioc,
          udp::endpoint server,
          std::uint16_t id,
          std::vector<std::uint8_t> request,
          std::chrono::milliseconds timeout,
          std::function<void()> release,
          MessageHandler handler)
        : strand_(boost::asio::make_strand(ioc)),
          socket_(strand_),
          timer_(strand_),
          server_(std::move(server)),
          id_(id),
          request_(std::move(request)),
          timeout_(timeout),
          release_(std::move(release)),
          handler_(std::move(handler)) {}

    void Start() {
        boost::asio::dispatch(strand_, [self = shared_from_this()] { self->DoStart(); });
    }

    void Cancel(sixpn::Status reason) {
        boost::asio::dispatch(strand_, [self = shared_from_this(), reason = std::move(reason)]() mutable {
            self->Finish(std::move(reason));
        });
    }

private:
    void DoStart() {
        if (done_) {
            return;
        }

        boost::system::error_code ec;
        socket_.open(server_.protocol(), ec);
        if (ec) {
            return Finish(FromErrorCode("open udp socket", ec));
        }

        timer_.expires_after(timeout_);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            self->Finish(sixpn::Status(sixpn::StatusCode::timeout, "dns query timed out"));
        });

        socket_.async_send_to(boost::asio::buffer(request_), server_,
            [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    return self->Finish(FromErrorCode("dns send", ec));
                }
                self->Receive();
            });
    }

    void Receive() {
        socket_.async_receive_from(boost::asio::buffer(buffer_), sender_,
            [self = shared_from_this()](const boost::system::error_code& ec, std::size_t n) {
                if (ec) {
                    return self->Finish(FromErrorCode("dns receive", ec));
                }
                auto r = ParseMessage(std::span<const std::uint8_t>(self->buffer_.data(), n));
                if (!r.ok()) {
                    return self->Finish(r.status());
                }
                // Stray or stale datagram: keep waiting for ours.
                if (r.value().id != self->id_ || !r.value().IsResponse()) {
                    return self->Receive();
                }
                self->Finish(std::move(r));
            });
    }

    void Finish(sixpn::Result<Message> result) {
        if (done_) {
            return;
        }
        done_ = true;

        timer_.cancel();
        boost::system::error_code ignored;
        socket_.close(ignored);

        auto handler = std::move(handler_);
        release_();
        handler(std::move(result));
    }

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    udp::socket socket_;
    boost::asio::steady_timer timer_;
    udp::endpoint server_;
    udp::endpoint sender_;
    std::uint16_t id_;
    std::vector<std::uint8_t> request_;
    std::array<std::uint8_t, kMaxUdpPayload> buffer_{};
    std::chrono::milliseconds timeout_;
    std::function<void()> release_;
    MessageHandler handler_;
    bool done_ = false;
};

boost::asio::ip::udp::endpoint DefaultNameserver(const std::string& resolv_conf) {
    std::ifstream ifs(resolv_conf);
    std::string line;
    while (std::getline(ifs, line)) {
        std::istringstream iss(line);
        std::string keyword;
        std::string host;
        if (!(iss >> keyword >> host) || keyword != "nameserver") {
            continue;
        }
        auto r = ParseNameserver(host, kDnsPort);
        if (r.ok()) {
            return r.value();
        }
    }
    return ParseNameserver(kFallbackNameserver, kDnsPort).value();
}

sixpn::Result<boost::asio::ip::udp::endpoint> ParseNameserver(std::string_view host, std::uint16_t port) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(std::string(host), ec);
    if (ec) {
        return sixpn::Status(sixpn::StatusCode::invalid_argument, "invalid nameserver address '" + std::string(host) + "'");
    }
    return udp::endpoint(addr, port);
}

std::string AppsQueryName() {
    return "_apps.internal";
}

std::string NearestInstancesQueryName(const discovery::Service& service) {
    return "top" + std::to_string(service.nearest) + ".nearest.of." + service.app_name + ".internal";
}

sixpn::Result<std::vector<std::string>> AppNamesFromResponse(const Message& msg) {
    if (auto st = CheckRcode(msg); !st.ok()) {
        return st;
    }
    if (msg.answers.empty()) {
        return sixpn::Status(sixpn::StatusCode::transport_error, "dns response had no answers");
    }
    if (!msg.answers.front().Is(RecordType::txt)) {
        return sixpn::Status(sixpn::StatusCode::transport_error, "first dns answer is not a TXT record");
    }

    auto strings = TxtStrings(msg.answers.front());
    if (!strings.ok()) {
        return strings.status();
    }

    std::vector<std::string> names;
    if (strings.value().empty()) {
        return names;
    }
    std::string_view rest = strings.value().front();
    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto part = rest.substr(0, comma);
        if (!part.empty()) {
            names.emplace_back(part);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
    return names;
}

sixpn::Result<std::vector<discovery::Instance>> InstancesFromResponse(const Message& msg, std::uint16_t port) {
    // An app with no running instances has no AAAA name at all.
    if (msg.Rcode() == kRcodeNameError && !msg.Truncated()) {
        return std::vector<discovery::Instance>{};
    }
    if (auto st = CheckRcode(msg); !st.ok()) {
        return st;
    }

    std::vector<discovery::Instance> out;
    for (const auto& rr : msg.answers) {
        if (!rr.Is(RecordType::aaaa)) {
            continue;
        }
        auto addr = AaaaAddress(rr);
        if (!addr.ok()) {
            return addr.status();
        }
        out.push_back(discovery::Instance{addr.value().to_string(), port});
    }
    return out;
}

LiveDnsClient::LiveDnsClient(boost::asio::io_context& ioc, DnsClientOptions options, chlog::logger& logger)
    : ioc_(ioc), options_(std::move(options)), logger_(logger), id_gen_(std::random_device{}()) {}

LiveDnsClient::~LiveDnsClient() = default;

void LiveDnsClient::ListAllServiceNames(NamesHandler handler) {
    Send(AppsQueryName(), RecordType::txt, [handler = std::move(handler)](sixpn::Result<Message> r) {
        if (!r.ok()) {
            return handler(r.status());
        }
        handler(AppNamesFromResponse(r.value()));
    });
}

void LiveDnsClient::ListInstancesOf(const discovery::Service& service, InstancesHandler handler) {
    Send(NearestInstancesQueryName(service), RecordType::aaaa,
        [self = shared_from_this(), service, handler = std::move(handler)](sixpn::Result<Message> r) {
            auto instances = r.ok() ? InstancesFromResponse(r.value(), service.port)
                                    : sixpn::Result<std::vector<discovery::Instance>>(r.status());
            if (instances.ok()) {
                self->logger_.info("Found {} instances of service ['{}', port: {}]",
                                   instances.value().size(), service.app_name, service.port);
            } else {
                self->logger_.warn("Error finding instances of service ['{}', port: {}]: '{}'",
                                   service.app_name, service.port, instances.status().ToString());
            }
            handler(std::move(instances));
        });
}

void LiveDnsClient::Send(std::string name, RecordType type, MessageHandler handler) {
    std::uint16_t id = 0;
    std::uint64_t key = 0;
    bool closed = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed = closed_;
        id = static_cast<std::uint16_t>(id_gen_() & 0xFFFF);
        key = next_key_++;
    }
    if (closed) {
        handler(sixpn::Status(sixpn::StatusCode::unavailable, "dns client is closed"));
        return;
    }

    auto request = EncodeQuery(id, name, type);
    if (!request.ok()) {
        handler(request.status());
        return;
    }

    std::weak_ptr<LiveDnsClient> weak = weak_from_this();
    auto query = std::make_shared<Query>(
        ioc_, options_.server, id, std::move(request).value(), options_.query_timeout,
        [weak, key] {
            if (auto self = weak.lock()) {
                self->Forget(key);
            }
        },
        std::move(handler));

    {
        std::lock_guard<std::mutex> lk(mu_);
        closed = closed_;
        if (!closed) {
            inflight_.emplace(key, query);
        }
    }

    if (closed) {
        query->Cancel(sixpn::Status(sixpn::StatusCode::unavailable, "dns client is closed"));
        return;
    }
    query->Start();
}

void LiveDnsClient::Forget(std::uint64_t key) {
    std::lock_guard<std::mutex> lk(mu_);
    inflight_.erase(key);
}

void LiveDnsClient::Close() {
    std::vector<std::shared_ptr<Query>> pending;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) {
            return;
        }
        closed_ = true;
        for (auto& [key, weak] : inflight_) {
            if (auto q = weak.lock()) {
                pending.push_back(std::move(q));
            }
        }
        inflight_.clear();
    }

    for (auto& q : pending) {
        q->Cancel(sixpn::Status(sixpn::StatusCode::cancelled, "dns client closed"));
    }
    logger_.debug("DNS client closed, cancelled {} in-flight queries", pending.size());
}

} // namespace sixpn::dns
