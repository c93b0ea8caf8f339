#include <sixpn/runtime/app.h>

#include <sixpn/core/log.h>

#include <csignal>
#include <thread>

#include <boost/asio/signal_set.hpp>

namespace sixpn {
namespace {

std::size_t ResolveThreads(std::size_t requested) {
    if (requested != 0) {
        return requested;
    }
    auto hc = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return hc == 0 ? static_cast<std::size_t>(1) : hc;
}

} // namespace

App::App(AppOptions options)
    : options_(std::move(options)), io_(ResolveThreads(options_.io_threads)) {
    sixpn::log::Init(options_.log_level);
}

App::~App() {
    Teardown();
}

IoThreads& App::Io() {
    return io_;
}

void App::AddComponent(std::shared_ptr<IComponent> component) {
    components_.push_back(std::move(component));
}

int App::Run() {
    auto signals = std::make_shared<boost::asio::signal_set>(io_.context(), SIGINT, SIGTERM);
    signals->async_wait([this, signals](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        sixpn::log::info("Received signal {}", signo);
        RequestStop();
    });

    io_.Start();
    for (auto& c : components_) {
        c->Start();
    }

    {
        std::unique_lock<std::mutex> lk(stop_mu_);
        stop_cv_.wait(lk, [&] { return stop_requested_; });
    }

    boost::system::error_code ignored;
    signals->cancel(ignored);
    Teardown();
    return 0;
}

void App::RequestStop() {
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

void App::Teardown() {
    if (torn_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    sixpn::log::info("Stopping...");
    // Components may wait on work that needs the io threads, so those go last.
    for (auto it = components_.rbegin(); it != components_.rend(); ++it) {
        (*it)->Stop();
    }
    io_.Stop();
    sixpn::log::info("Stopped.");
}

} // namespace sixpn
