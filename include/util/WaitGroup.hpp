#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace rapidcopy::util {

// Counter of outstanding work units; wait() returns once it drops to zero.
class WaitGroup {
public:
    void add(int64_t n = 1);
    void done();
    void wait();

    [[nodiscard]] int64_t count() const;

private:
    int64_t count_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace rapidcopy::util
