#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

namespace sixpn {

// Fixed-delay repeating task: each run starts `interval` after the previous
// run called its `done` callback.
//
// Not thread-safe: Start(), Cancel() and `done` must be used on `executor`.
class RepeatingTask : public std::enable_shared_from_this<RepeatingTask> {
public:
    using Done = std::function<void()>;
    using Body = std::function<void(Done done)>;

    RepeatingTask(boost::asio::any_io_executor executor,
                  std::chrono::milliseconds initial_delay,
                  std::chrono::milliseconds interval,
                  Body body);

    RepeatingTask(const RepeatingTask&) = delete;
    RepeatingTask& operator=(const RepeatingTask&) = delete;

    // No-op once started or cancelled.
    void Start();

    // Permanent; a run in progress finishes but is not rescheduled.
    void Cancel();

    bool cancelled() const { return cancelled_; }
    std::uint64_t runs() const { return runs_; }

private:
    void Schedule(std::chrono::milliseconds delay);
    void Run();

    boost::asio::steady_timer timer_;
    const std::chrono::milliseconds initial_delay_;
    const std::chrono::milliseconds interval_;
    Body body_;

    bool started_ = false;
    bool cancelled_ = false;
    std::uint64_t runs_ = 0;
};

} // namespace sixpn
