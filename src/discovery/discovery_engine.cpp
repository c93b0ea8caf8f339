#include <sixpn/discovery/discovery_engine.h>

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <stdexcept>

#include <boost/asio/dispatch.hpp>

namespace sixpn::discovery {

std::shared_ptr<DiscoveryEngine> DiscoveryEngine::Create(
    boost::asio::io_context& ioc,
    std::shared_ptr<dns::INameResolutionClient> client,
    DiscoveryOptions options,
    chlog::logger& logger,
    sixpn::MetricsRegistry& metrics) {
    if (!client) {
        throw std::invalid_argument("DiscoveryEngine requires a name resolution client");
    }
    if (options.default_lookup_timeout.count() <= 0 || options.refresh_interval.count() <= 0 ||
        options.cleanup_interval.count() <= 0) {
        throw std::invalid_argument("DiscoveryEngine intervals must be > 0");
    }

    auto engine = std::make_shared<DiscoveryEngine>(PrivateTag{}, ioc, std::move(client), options, logger, metrics);
    engine->StartCleanup();
    return engine;
}

DiscoveryEngine::DiscoveryEngine(PrivateTag,
                                 boost::asio::io_context& ioc,
                                 std::shared_ptr<dns::INameResolutionClient> client,
                                 DiscoveryOptions options,
                                 chlog::logger& logger,
                                 sixpn::MetricsRegistry& metrics)
    : strand_(boost::asio::make_strand(ioc)),
      client_(std::move(client)),
      options_(options),
      logger_(logger),
      metrics_(metrics) {}

DiscoveryEngine::~DiscoveryEngine() {
    if (!IsShutdown()) {
        logger_.error("DiscoveryEngine::Shutdown() was not called before destruction");
        assert(false && "DiscoveryEngine::Shutdown() must be called before destruction");
    }
}

sixpn::Status DiscoveryEngine::TransportFailure(const sixpn::Status& st) {
    if (st.code() == sixpn::StatusCode::transport_error) {
        return st;
    }
    return sixpn::Status(sixpn::StatusCode::transport_error, st.ToString());
}

sixpn::Status DiscoveryEngine::Unavailable() {
    return sixpn::Status(sixpn::StatusCode::unavailable, "service discovery is shut down");
}

void DiscoveryEngine::StartCleanup() {
    std::weak_ptr<DiscoveryEngine> weak = weak_from_this();
    boost::asio::dispatch(strand_, [weak] {
        auto self = weak.lock();
        if (!self || self->IsShutdown()) {
            return;
        }
        self->cleanup_task_ = std::make_shared<RepeatingTask>(
            self->strand_, self->options_.cleanup_interval, self->options_.cleanup_interval,
            [weak](RepeatingTask::Done done) {
                auto self = weak.lock();
                if (!self) {
                    return;
                }
                if (self->IsShutdown()) {
                    self->cleanup_task_->Cancel();
                    return done();
                }
                if (auto removed = self->subscriptions_.Sweep(); removed > 0) {
                    self->logger_.debug("Removed {} cancelled subscriptions", removed);
                    self->metrics_.GetCounter("sixpn_subscriptions_swept_total", "Cancelled subscriptions removed by the sweep")
                        .Inc(static_cast<std::int64_t>(removed));
                }
                done();
            });
        self->cleanup_task_->Start();
    });
}

// ---- Registration ----

void DiscoveryEngine::Register(std::vector<Service> services, StatusCallback done) {
    if (IsShutdown()) {
        done(Unavailable());
        return;
    }

    boost::asio::dispatch(strand_, [self = shared_from_this(), services = std::move(services), done = std::move(done)]() mutable {
        if (self->IsShutdown()) {
            return done(Unavailable());
        }
        self->registrations_.push_back(PendingRegistration{std::move(services), std::move(done)});
        if (!self->registering_) {
            self->StartNextRegistration();
        }
    });
}

void DiscoveryEngine::StartNextRegistration() {
    while (!registrations_.empty()) {
        if (registrations_.front().services.empty()) {
            auto done = std::move(registrations_.front().done);
            registrations_.pop_front();
            done(sixpn::Status::Ok());
            continue;
        }

        registering_ = true;
        logger_.info("Querying DNS for all apps on the private network...");
        client_->ListAllServiceNames([self = shared_from_this()](sixpn::Result<std::vector<std::string>> names) {
            boost::asio::dispatch(self->strand_, [self, names = std::move(names)]() mutable {
                self->FinishRegistration(std::move(names));
            });
        });
        return;
    }
}

void DiscoveryEngine::FinishRegistration(sixpn::Result<std::vector<std::string>> names) {
    registering_ = false;
    if (registrations_.empty()) {
        // Drained by shutdown while the query was in flight.
        return;
    }

    auto pending = std::move(registrations_.front());
    registrations_.pop_front();

    sixpn::Status st;
    if (IsShutdown()) {
        st = Unavailable();
    } else if (!names.ok()) {
        st = TransportFailure(names.status());
        logger_.error("Could not list apps on the private network: {}", st.ToString());
    } else {
        const auto& known = names.value();
        std::vector<std::string> missing;
        for (const auto& service : pending.services) {
            if (std::find(known.begin(), known.end(), service.app_name) == known.end()) {
                missing.push_back(service.app_name);
            }
        }

        if (!missing.empty()) {
            st = sixpn::Status(sixpn::StatusCode::not_found, "could not find services", std::move(missing));
            logger_.error("The following service apps were NOT found on the private network: {}", st.ToString());
        } else {
            for (const auto& service : pending.services) {
                registry_.Register(service);
            }
            logger_.info("Found all {} service apps on the private network", pending.services.size());
            EnsureRefreshScheduled();
        }
    }

    pending.done(std::move(st));
    StartNextRegistration();
}

// ---- Subscriptions ----

CancellationToken DiscoveryEngine::Subscribe(const Service& service, NextHandler on_next, CompletionHandler on_complete) {
    logger_.debug("Subscribing to '{}' instance updates", service.app_name);

    if (IsShutdown()) {
        if (on_complete) {
            on_complete(CompletionReason::service_discovery_unavailable);
        }
        return CancellationToken(true);
    }

    CancellationToken token(false, std::move(on_complete));
    boost::asio::dispatch(strand_, [self = shared_from_this(), service, on_next = std::move(on_next), token]() mutable {
        if (self->IsShutdown()) {
            SubscriptionRegistry::Complete(token, CompletionReason::service_discovery_unavailable);
            return;
        }

        // Refresh rounds reach the subscription only after its initial delivery.
        self->StartLookup(service, self->options_.default_lookup_timeout,
            [self, service, token, on_next = std::move(on_next)](InstancesResult r) {
                if (self->IsShutdown()) {
                    SubscriptionRegistry::Complete(token, CompletionReason::service_discovery_unavailable);
                    return;
                }
                if (token.IsCancelled()) {
                    return;
                }
                on_next(std::move(r));
                self->subscriptions_.Add(service, on_next, token);
            });
    });
    return token;
}

// ---- Shutdown ----

void DiscoveryEngine::Shutdown(StatusCallback done) {
    boost::asio::dispatch(strand_, [self = shared_from_this(), done = std::move(done)] {
        bool expected = false;
        if (self->shutdown_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            self->Teardown();
        }
        if (done) {
            done(sixpn::Status::Ok());
        }
    });
}

void DiscoveryEngine::Teardown() {
    client_->Close();
    logger_.debug("Service discovery is shutting down, closing all active queries and subscriptions");

    if (refresh_task_) {
        refresh_task_->Cancel();
    }
    if (cleanup_task_) {
        cleanup_task_->Cancel();
    }

    // Subscriptions first, so lookups failed below no longer reach on_next.
    auto completed = subscriptions_.CompleteAll(CompletionReason::service_discovery_unavailable);

    auto inflight = std::move(inflight_);
    inflight_.clear();
    for (auto& [id, op] : inflight) {
        op->Complete(Unavailable());
    }

    auto registrations = std::move(registrations_);
    registrations_.clear();
    registering_ = false;
    for (auto& pending : registrations) {
        pending.done(Unavailable());
    }

    logger_.info("Service discovery shut down ({} subscriptions completed, {} operations abandoned)",
                 completed, inflight.size());
}

void DiscoveryEngine::CountLookup(std::string_view outcome) {
    metrics_.GetCounter("sixpn_lookups_total", "Instance lookups by outcome", {{"outcome", std::string(outcome)}}).Inc();
}

} // namespace sixpn::discovery
