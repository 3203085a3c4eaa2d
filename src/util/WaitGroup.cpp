#include "util/WaitGroup.hpp"
#include <stdexcept>
#include <string>

namespace rapidcopy::util {

void WaitGroup::add(int64_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ + n < 0) {
        throw std::logic_error("WaitGroup: negative count (" + std::to_string(count_ + n) + ")");
    }
    count_ += n;
    if (count_ == 0) {
        cv_.notify_all();
    }
}

void WaitGroup::done() {
    add(-1);
}

void WaitGroup::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return count_ == 0; });
}

int64_t WaitGroup::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

}  // namespace rapidcopy::util
