#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace sixpn {

// One io_context shared by a fixed set of threads. Components that keep
// state serialize themselves with strands of context().
class IoThreads {
public:
    explicit IoThreads(std::size_t threads);
    ~IoThreads();

    IoThreads(const IoThreads&) = delete;
    IoThreads& operator=(const IoThreads&) = delete;

    boost::asio::io_context& context() { return ioc_; }

    std::size_t size() const { return threads_; }
    bool running() const { return started_.load(std::memory_order_acquire); }

    void Start();

    // Drops the work guard, stops the context and joins the threads.
    // Must not be called from one of the threads.
    void Stop();

private:
    const std::size_t threads_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
    std::vector<std::thread> workers_;
    std::atomic<bool> started_{false};
};

} // namespace sixpn
