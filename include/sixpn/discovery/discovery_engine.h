#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <chlog/chlog.hpp>

#include <sixpn/core/log.h>
#include <sixpn/core/metrics.h>
#include <sixpn/discovery/service_discovery.h>
#include <sixpn/discovery/service_registry.h>
#include <sixpn/discovery/subscription_registry.h>
#include <sixpn/discovery/timed_operation.h>
#include <sixpn/dns/name_resolution_client.h>
#include <sixpn/runtime/repeating_task.h>

namespace sixpn::discovery {

// Service discovery over the private network's name service.
//
// All mutable state lives on one strand of `ioc`; public calls from other
// threads are posted there and never block. Callbacks run on that strand,
// except fail-fast paths after shutdown, which run on the caller's thread.
//
// Shutdown() must complete before the last reference is dropped.
class DiscoveryEngine final : public IServiceDiscovery, public std::enable_shared_from_this<DiscoveryEngine> {
    // Restricts construction to Create().
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static std::shared_ptr<DiscoveryEngine> Create(
        boost::asio::io_context& ioc,
        std::shared_ptr<dns::INameResolutionClient> client,
        DiscoveryOptions options,
        chlog::logger& logger = sixpn::log::Get(),
        sixpn::MetricsRegistry& metrics = sixpn::DefaultMetrics());

    DiscoveryEngine(PrivateTag,
                    boost::asio::io_context& ioc,
                    std::shared_ptr<dns::INameResolutionClient> client,
                    DiscoveryOptions options,
                    chlog::logger& logger,
                    sixpn::MetricsRegistry& metrics);
    ~DiscoveryEngine() override;

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    std::chrono::milliseconds DefaultLookupTimeout() const override { return options_.default_lookup_timeout; }

    void Register(std::vector<Service> services, StatusCallback done) override;
    void Lookup(const Service& service, std::optional<Deadline> deadline, LookupCallback callback) override;
    CancellationToken Subscribe(const Service& service, NextHandler on_next, CompletionHandler on_complete = {}) override;
    void Shutdown(StatusCallback done = {}) override;

    bool IsShutdown() const override { return shutdown_.load(std::memory_order_acquire); }

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    using Instances = std::vector<Instance>;
    using InstancesOperation = TimedOperation<Instances>;

    struct PendingRegistration {
        std::vector<Service> services;
        StatusCallback done;
    };

    struct RefreshRound;

    void StartCleanup();

    // Registration (strand only)
    void StartNextRegistration();
    void FinishRegistration(sixpn::Result<std::vector<std::string>> names);

    // Lookups (strand only)
    void StartLookup(const Service& service, std::chrono::steady_clock::duration timeout, LookupCallback callback);
    std::shared_ptr<InstancesOperation> Track(InstancesOperation::Handler handler);
    void Resolve(const Service& service, std::shared_ptr<InstancesOperation> op);

    // Refresh (strand only)
    void EnsureRefreshScheduled();
    void RunRefreshRound(RepeatingTask::Done done);
    void ApplyRefreshRound(const RefreshRound& round);

    void Teardown();

    void CountLookup(std::string_view outcome);

    // Failures reported by the client surface as transport_error.
    static sixpn::Status TransportFailure(const sixpn::Status& st);
    static sixpn::Status Unavailable();

    Strand strand_;
    std::shared_ptr<dns::INameResolutionClient> client_;
    const DiscoveryOptions options_;
    chlog::logger& logger_;
    sixpn::MetricsRegistry& metrics_;

    std::atomic<bool> shutdown_{false};

    ServiceRegistry registry_;
    SubscriptionRegistry subscriptions_;

    std::deque<PendingRegistration> registrations_;
    bool registering_ = false;

    std::uint64_t next_operation_ = 0;
    std::unordered_map<std::uint64_t, std::shared_ptr<InstancesOperation>> inflight_;

    std::shared_ptr<RepeatingTask> refresh_task_;
    std::shared_ptr<RepeatingTask> cleanup_task_;
};

} // namespace sixpn::discovery
