#include <sixpn/discovery/discovery_engine.h>

#include <boost/asio/dispatch.hpp>

namespace sixpn::discovery {

void DiscoveryEngine::Lookup(const Service& service, std::optional<Deadline> deadline, LookupCallback callback) {
    if (IsShutdown()) {
        CountLookup(ToString(sixpn::StatusCode::unavailable));
        callback(Unavailable());
        return;
    }

    std::chrono::steady_clock::duration timeout = options_.default_lookup_timeout;
    if (deadline) {
        // Clamp before subtracting; time_point::min() would overflow.
        auto now = std::chrono::steady_clock::now();
        timeout = *deadline <= now ? std::chrono::steady_clock::duration::zero() : *deadline - now;
    }

    logger_.debug("Looking up '{}' instances", service.app_name);
    boost::asio::dispatch(strand_, [self = shared_from_this(), service, timeout, callback = std::move(callback)]() mutable {
        self->StartLookup(service, timeout, std::move(callback));
    });
}

void DiscoveryEngine::StartLookup(const Service& service, std::chrono::steady_clock::duration timeout, LookupCallback callback) {
    if (IsShutdown()) {
        CountLookup(ToString(sixpn::StatusCode::unavailable));
        return callback(Unavailable());
    }

    auto timed_out = sixpn::Status(sixpn::StatusCode::timeout, "lookup of '" + service.ToString() + "' timed out");
    if (timeout <= std::chrono::steady_clock::duration::zero()) {
        CountLookup(ToString(sixpn::StatusCode::timeout));
        return callback(std::move(timed_out));
    }

    auto op = Track([self = shared_from_this(), service, callback = std::move(callback)](InstancesResult r) {
        if (r.ok()) {
            self->logger_.debug("Found '{}' instances: {}", service.app_name, ToString(r.value()));
            self->CountLookup(ToString(sixpn::StatusCode::ok));
        } else {
            self->logger_.debug("Error looking up '{}' instances: '{}'", service.app_name, r.status().ToString());
            self->CountLookup(ToString(r.status().code()));
        }
        callback(std::move(r));
    });
    op->Arm(timeout, std::move(timed_out));
    Resolve(service, op);
}

std::shared_ptr<DiscoveryEngine::InstancesOperation> DiscoveryEngine::Track(InstancesOperation::Handler handler) {
    auto id = next_operation_++;
    auto op = std::make_shared<InstancesOperation>(
        strand_,
        [self = shared_from_this(), id, handler = std::move(handler)](InstancesResult r) {
            self->inflight_.erase(id);
            handler(std::move(r));
        });
    inflight_.emplace(id, op);
    return op;
}

void DiscoveryEngine::Resolve(const Service& service, std::shared_ptr<InstancesOperation> op) {
    const auto* cached = registry_.Find(service);
    if (cached == nullptr) {
        op->Complete(sixpn::Status(sixpn::StatusCode::unknown_service, "service '" + service.ToString() + "' is not registered"));
        return;
    }
    if (!cached->empty()) {
        op->Complete(*cached);
        return;
    }

    client_->ListInstancesOf(service, [self = shared_from_this(), service, op](InstancesResult r) {
        boost::asio::dispatch(self->strand_, [self, service, op, r = std::move(r)]() mutable {
            if (op->done()) {
                // Timed out or shut down; the answer is discarded.
                return;
            }
            if (!r.ok()) {
                op->Complete(TransportFailure(r.status()));
                return;
            }
            // A refresh round may have filled the cache meanwhile; it wins.
            if (const auto* current = self->registry_.Find(service); current != nullptr && !current->empty()) {
                op->Complete(*current);
                return;
            }
            // An empty answer is not cached, so the next lookup asks again.
            if (!r.value().empty()) {
                self->registry_.Update(service, r.value());
            }
            op->Complete(std::move(r));
        });
    });
}

} // namespace sixpn::discovery
