#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <fcntl.h>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <unistd.h>

namespace rapidcopy::util {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

}  // namespace

std::error_code ContentHasher::sha256_file(const std::string& path,
                                           std::vector<char>& buffer,
                                           const CancellationToken& token,
                                           Digest& digest) {
    if (buffer.empty()) {
        buffer.resize(64 * 1024);
    }

    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::error_code(errno, std::generic_category());
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        close(fd);
        Logger::error("ContentHasher: EVP_DigestInit_ex failed");
        return std::make_error_code(std::errc::not_enough_memory);
    }

    std::error_code result;
    while (true) {
        if (token.is_cancelled()) {
            result = std::make_error_code(std::errc::operation_canceled);
            break;
        }

        ssize_t n = read(fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            result = std::error_code(errno, std::generic_category());
            break;
        }
        if (n == 0) break;

        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            result = std::make_error_code(std::errc::io_error);
            break;
        }
    }
    close(fd);

    if (result) return result;

    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != DIGEST_SIZE) {
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::string ContentHasher::to_hex(const Digest& digest) {
    std::ostringstream hex;
    for (auto byte : digest) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return hex.str();
}

}  // namespace rapidcopy::util
