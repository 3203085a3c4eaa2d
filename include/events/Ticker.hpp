#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace rapidcopy::events {

// Runs a task on its own thread every `interval` until stopped.
class Ticker {
public:
    using Task = std::function<void()>;

    Ticker(std::string name, std::chrono::milliseconds interval, Task task);
    ~Ticker();

    Ticker(const Ticker&) = delete;
    Ticker& operator=(const Ticker&) = delete;

    void start();

    // Wakes the thread immediately and joins it. The task never runs after
    // stop() returns. Idempotent.
    void stop();

    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

private:
    void run();

    std::string name_;
    std::chrono::milliseconds interval_;
    Task task_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}  // namespace rapidcopy::events
