#include <sixpn/runtime/io_threads.h>

#include <stdexcept>

namespace sixpn {
namespace {

std::size_t CheckThreads(std::size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("IoThreads needs at least one thread");
    }
    return threads;
}

} // namespace

IoThreads::IoThreads(std::size_t threads)
    : threads_(CheckThreads(threads)),
      ioc_(static_cast<int>(threads_)),
      guard_(boost::asio::make_work_guard(ioc_)) {}

IoThreads::~IoThreads() {
    Stop();
}

void IoThreads::Start() {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    workers_.reserve(threads_);
    for (std::size_t i = 0; i < threads_; ++i) {
        workers_.emplace_back([this] { ioc_.run(); });
    }
}

void IoThreads::Stop() {
    if (!started_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    guard_.reset();
    ioc_.stop();
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
}

} // namespace sixpn
