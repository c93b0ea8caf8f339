#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <sixpn/core/status.h>

namespace sixpn::discovery {

// Races a result against a timer; the first to arrive is delivered and the
// other is dropped.
//
// Not thread-safe: Arm(), Complete() and the timer all run on `executor`,
// which must be the engine's strand.
template <class T>
class TimedOperation : public std::enable_shared_from_this<TimedOperation<T>> {
public:
    using Handler = std::function<void(sixpn::Result<T>)>;

    TimedOperation(boost::asio::any_io_executor executor, Handler handler)
        : timer_(std::move(executor)), handler_(std::move(handler)) {}

    TimedOperation(const TimedOperation&) = delete;
    TimedOperation& operator=(const TimedOperation&) = delete;

    void Arm(std::chrono::steady_clock::duration timeout, sixpn::Status on_expiry) {
        timer_.expires_after(timeout);
        timer_.async_wait([self = this->shared_from_this(), on_expiry = std::move(on_expiry)](
                              const boost::system::error_code& ec) mutable {
            if (ec) {
                return;
            }
            self->Complete(std::move(on_expiry));
        });
    }

    // Returns false when the operation already finished and `result` was dropped.
    bool Complete(sixpn::Result<T> result) {
        if (done_) {
            return false;
        }
        done_ = true;
        timer_.cancel();

        auto handler = std::move(handler_);
        handler_ = nullptr;
        handler(std::move(result));
        return true;
    }

    bool done() const { return done_; }

private:
    boost::asio::steady_timer timer_;
    Handler handler_;
    bool done_ = false;
};

} // namespace sixpn::discovery
