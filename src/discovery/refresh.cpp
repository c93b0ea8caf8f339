#include <sixpn/discovery/discovery_engine.h>

#include <boost/asio/dispatch.hpp>

namespace sixpn::discovery {

struct DiscoveryEngine::RefreshRound {
    std::vector<Service> services;
    std::vector<std::optional<InstancesResult>> results;
    std::size_t pending = 0;
    std::chrono::steady_clock::time_point started;
    RepeatingTask::Done done;
};

void DiscoveryEngine::EnsureRefreshScheduled() {
    if (refresh_task_) {
        return;
    }

    std::weak_ptr<DiscoveryEngine> weak = weak_from_this();
    refresh_task_ = std::make_shared<RepeatingTask>(
        strand_, std::chrono::milliseconds(0), options_.refresh_interval,
        [weak](RepeatingTask::Done done) {
            if (auto self = weak.lock()) {
                self->RunRefreshRound(std::move(done));
            }
        });
    refresh_task_->Start();
}

void DiscoveryEngine::RunRefreshRound(RepeatingTask::Done done) {
    if (IsShutdown()) {
        refresh_task_->Cancel();
        return done();
    }

    auto round = std::make_shared<RefreshRound>();
    round->services = registry_.Services();
    round->results.resize(round->services.size());
    round->pending = round->services.size();
    round->started = std::chrono::steady_clock::now();
    round->done = std::move(done);

    metrics_.GetCounter("sixpn_refresh_rounds_total", "Background refresh rounds started").Inc();
    if (round->services.empty()) {
        return round->done();
    }

    logger_.info("Updating service instances...");

    // Every call is issued before any result is applied; results may arrive inline.
    for (std::size_t i = 0; i < round->services.size(); ++i) {
        const auto& service = round->services[i];
        logger_.debug("Looking for top {} closest instances of service ['{}', port: {}]",
                      service.nearest, service.app_name, service.port);

        auto op = Track([self = shared_from_this(), round, i](InstancesResult r) {
            round->results[i] = std::move(r);
            if (--round->pending == 0) {
                self->ApplyRefreshRound(*round);
                round->done();
            }
        });
        op->Arm(options_.default_lookup_timeout,
                sixpn::Status(sixpn::StatusCode::timeout, "timed out updating instances of service ['" +
                                                              service.app_name + "', port: " +
                                                              std::to_string(service.port) + "]"));

        client_->ListInstancesOf(service, [self = shared_from_this(), op](InstancesResult r) {
            boost::asio::dispatch(self->strand_, [op, r = std::move(r)]() mutable {
                op->Complete(std::move(r));
            });
        });
    }
}

void DiscoveryEngine::ApplyRefreshRound(const RefreshRound& round) {
    if (IsShutdown()) {
        logger_.debug("Dropping refresh round finished after shutdown");
        return;
    }

    std::vector<std::pair<Service, Instances>> changed;
    std::size_t failed = 0;
    for (std::size_t i = 0; i < round.services.size(); ++i) {
        const auto& service = round.services[i];
        const auto& result = *round.results[i];

        // A failed call keeps the last known instances and notifies nobody.
        if (!result.ok()) {
            ++failed;
            logger_.warn("Updating instances of service ['{}', port: {}] failed: {}",
                         service.app_name, service.port, result.status().ToString());
            continue;
        }
        if (registry_.Update(service, result.value())) {
            changed.emplace_back(service, result.value());
        }
    }

    // The whole batch is in the registry before anyone hears about it.
    for (const auto& [service, instances] : changed) {
        auto notified = subscriptions_.Notify(service, InstancesResult(instances));
        metrics_.GetCounter("sixpn_subscriber_updates_total", "Updates delivered to subscribers")
            .Inc(static_cast<std::int64_t>(notified));
        logger_.info("Instances of '{}' changed to {}, notified {} subscribers",
                     service.app_name, ToString(instances), notified);
    }

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - round.started).count();
    metrics_.GetHistogram("sixpn_refresh_round_ms", "Background refresh round latency (ms)",
                          {1, 5, 10, 50, 100, 500, 1000, 5000})
        .Observe(elapsed);
    logger_.debug("Refresh round done in {:.1f} ms: {} services, {} changed, {} failed",
                  elapsed, round.services.size(), changed.size(), failed);
}

} // namespace sixpn::discovery
