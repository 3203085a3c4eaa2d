#pragma once

#include <stop_token>

namespace rapidcopy::util {

/**
 * Shared "stop requested" flag. Copies observe the same state; once cancelled it
 * stays cancelled. Workers poll is_cancelled() at their checkpoints, nobody blocks
 * on it.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    // Idempotent. Returns true only for the call that actually flipped the flag.
    bool cancel() noexcept { return source_.request_stop(); }

    [[nodiscard]] bool is_cancelled() const noexcept { return source_.stop_requested(); }

    [[nodiscard]] std::stop_token token() const noexcept { return source_.get_token(); }

private:
    std::stop_source source_;
};

}  // namespace rapidcopy::util
