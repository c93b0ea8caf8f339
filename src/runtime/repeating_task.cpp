#include <sixpn/runtime/repeating_task.h>

namespace sixpn {

RepeatingTask::RepeatingTask(boost::asio::any_io_executor executor,
                             std::chrono::milliseconds initial_delay,
                             std::chrono::milliseconds interval,
                             Body body)
    : timer_(std::move(executor)),
      initial_delay_(initial_delay),
      interval_(interval),
      body_(std::move(body)) {}

void RepeatingTask::Start() {
    if (started_ || cancelled_) {
        return;
    }
    started_ = true;
    Schedule(initial_delay_);
}

void RepeatingTask::Cancel() {
    cancelled_ = true;
    timer_.cancel();
}

void RepeatingTask::Schedule(std::chrono::milliseconds delay) {
    timer_.expires_after(delay);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || self->cancelled_) {
            return;
        }
        self->Run();
    });
}

void RepeatingTask::Run() {
    ++runs_;
    auto finished = std::make_shared<bool>(false);
    std::weak_ptr<RepeatingTask> weak = weak_from_this();
    body_([weak, finished] {
        if (*finished) {
            return;
        }
        *finished = true;
        auto self = weak.lock();
        if (!self || self->cancelled_) {
            return;
        }
        self->Schedule(self->interval_);
    });
}

} // namespace sixpn
