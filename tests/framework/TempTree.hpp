#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace rapidcopy::test {

// Scratch directory under /tmp, removed on destruction
class TempTree {
public:
    explicit TempTree(const std::string& prefix = "rapidcopy_test") {
        std::string pattern = (std::filesystem::temp_directory_path() / (prefix + "_XXXXXX")).string();
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed for " + pattern);
        }
        root_ = pattern;
    }

    ~TempTree() {
        std::error_code ec;
        // Restore permissions so removal can descend everywhere
        for (auto it = std::filesystem::recursive_directory_iterator(
                 root_, std::filesystem::directory_options::skip_permission_denied, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::add, ec);
        }
        std::filesystem::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    std::filesystem::path write(const std::filesystem::path& relative, const std::string& content) {
        auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        f << content;
        return path;
    }

    std::filesystem::path mkdir(const std::filesystem::path& relative) {
        auto path = root_ / relative;
        std::filesystem::create_directories(path);
        return path;
    }

private:
    std::filesystem::path root_;
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// Deterministic filler so multi-chunk copies have content worth comparing
inline std::string pattern_content(size_t size, unsigned seed = 7) {
    std::string out(size, '\0');
    unsigned state = seed;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        out[i] = static_cast<char>((state >> 16) & 0xFF);
    }
    return out;
}

inline bool running_as_root() {
    return geteuid() == 0;
}

} // namespace rapidcopy::test
