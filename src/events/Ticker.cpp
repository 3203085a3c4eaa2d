#include "events/Ticker.hpp"
#include "util/Logger.hpp"

namespace rapidcopy::events {

Ticker::Ticker(std::string name, std::chrono::milliseconds interval, Task task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)) {
    if (interval_ <= std::chrono::milliseconds::zero()) {
        interval_ = std::chrono::milliseconds(100);
    }
}

Ticker::~Ticker() {
    stop();
}

void Ticker::start() {
    if (thread_.joinable()) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    util::Logger::debug("Ticker[" + name_ + "]: every " + std::to_string(interval_.count()) + "ms");
    thread_ = std::thread([this]() { run(); });
}

void Ticker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void Ticker::run() {
    auto next = std::chrono::steady_clock::now() + interval_;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (cv_.wait_until(lock, next, [this]() { return stopping_; })) {
            break;
        }
        next += interval_;

        // Run the task unlocked so stop() is never held up by a slow sample
        lock.unlock();
        task_();
        lock.lock();
    }
}

}  // namespace rapidcopy::events
