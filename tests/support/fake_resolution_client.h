#pragma once

#include <sixpn/dns/name_resolution_client.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace sixpn::testing {

// Scriptable INameResolutionClient. Answers come from the functions set by the
// test; with a non-zero delay they are delivered from a timer on `ioc`,
// otherwise inline. Instance calls may be given a delay per call number,
// counted from 1.
class FakeResolutionClient final : public sixpn::dns::INameResolutionClient {
public:
    using NamesFn = std::function<sixpn::Result<std::vector<std::string>>()>;
    using InstancesFn = std::function<sixpn::Result<std::vector<sixpn::discovery::Instance>>(const sixpn::discovery::Service&)>;
    using DelayFn = std::function<std::chrono::milliseconds(int call)>;

    explicit FakeResolutionClient(boost::asio::io_context& ioc) : ioc_(ioc) {}

    void SetNames(std::vector<std::string> names) {
        SetNames([names = std::move(names)]() -> sixpn::Result<std::vector<std::string>> { return names; });
    }

    void SetNames(NamesFn fn) {
        std::lock_guard<std::mutex> lk(mu_);
        names_ = std::move(fn);
    }

    void SetInstances(InstancesFn fn) {
        std::lock_guard<std::mutex> lk(mu_);
        instances_ = std::move(fn);
    }

    void SetDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lk(mu_);
        delay_ = delay;
    }

    void SetInstancesDelay(DelayFn fn) {
        std::lock_guard<std::mutex> lk(mu_);
        instances_delay_ = std::move(fn);
    }

    void ListAllServiceNames(sixpn::dns::NamesHandler handler) override {
        ++names_calls;
        auto outstanding = ++names_outstanding;
        for (auto seen = max_names_outstanding.load(); outstanding > seen;) {
            if (max_names_outstanding.compare_exchange_weak(seen, outstanding)) {
                break;
            }
        }
        NamesFn fn;
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lk(mu_);
            fn = names_;
            delay = delay_;
        }
        auto result = fn ? fn() : sixpn::Result<std::vector<std::string>>(std::vector<std::string>{});
        Reply(delay, [this, handler = std::move(handler), result = std::move(result)]() mutable {
            --names_outstanding;
            handler(std::move(result));
        });
    }

    void ListInstancesOf(const sixpn::discovery::Service& service, sixpn::dns::InstancesHandler handler) override {
        int call = ++instances_calls;
        InstancesFn fn;
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lk(mu_);
            fn = instances_;
            delay = instances_delay_ ? instances_delay_(call) : delay_;
        }
        auto result = fn ? fn(service)
                         : sixpn::Result<std::vector<sixpn::discovery::Instance>>(std::vector<sixpn::discovery::Instance>{});
        Reply(delay, [handler = std::move(handler), result = std::move(result)]() mutable {
            handler(std::move(result));
        });
    }

    void Close() override { ++close_calls; }

    std::atomic<int> names_calls{0};
    std::atomic<int> instances_calls{0};
    std::atomic<int> close_calls{0};
    std::atomic<int> names_outstanding{0};
    std::atomic<int> max_names_outstanding{0};

private:
    void Reply(std::chrono::milliseconds delay, std::function<void()> fn) {
        if (delay.count() == 0) {
            fn();
            return;
        }
        auto timer = std::make_shared<boost::asio::steady_timer>(ioc_, delay);
        timer->async_wait([timer, fn = std::move(fn)](const boost::system::error_code&) { fn(); });
    }

    boost::asio::io_context& ioc_;
    std::mutex mu_;
    NamesFn names_;
    InstancesFn instances_;
    DelayFn instances_delay_;
    std::chrono::milliseconds delay_{0};
};

} // namespace sixpn::testing
