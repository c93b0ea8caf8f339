#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sixpn/runtime/io_threads.h>

namespace sixpn {

// Something with a lifetime bound to the App: started after the io threads,
// stopped before them, in reverse order of addition.
class IComponent {
public:
    virtual ~IComponent() = default;
    virtual void Start() = 0;

    // May block until the component's asynchronous teardown finished.
    virtual void Stop() = 0;
};

struct AppOptions {
    std::size_t io_threads = 0; // 0: hardware concurrency
    std::string log_level = "info";
};

class App {
public:
    explicit App(AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    IoThreads& Io();

    void AddComponent(std::shared_ptr<IComponent> component);

    // Blocks until RequestStop() or SIGINT/SIGTERM, then stops the components
    // and the io threads on the calling thread.
    int Run();

    // Thread-safe, idempotent; safe from io threads and signal handlers.
    void RequestStop();

private:
    void Teardown();

    AppOptions options_;
    IoThreads io_;
    std::vector<std::shared_ptr<IComponent>> components_;

    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    bool stop_requested_{false};
    std::atomic<bool> torn_down_{false};
};

} // namespace sixpn
