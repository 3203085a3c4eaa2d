#pragma once

#include "util/CancellationToken.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace rapidcopy::util {

class ContentHasher {
public:
    static constexpr size_t DIGEST_SIZE = 32;
    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    // Streams a file through SHA-256 using the caller's buffer. Cancellation is
    // polled before every chunk and reported as operation_canceled.
    [[nodiscard]] static std::error_code sha256_file(const std::string& path,
                                                     std::vector<char>& buffer,
                                                     const CancellationToken& token,
                                                     Digest& digest);

    [[nodiscard]] static std::string to_hex(const Digest& digest);
};

}  // namespace rapidcopy::util
