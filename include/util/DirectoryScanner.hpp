#pragma once

#include "util/CancellationToken.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace rapidcopy::util {

/**
 * DirectoryScanner: directory listing straight from the getdents64 syscall.
 *
 * One syscall with a 256KB buffer returns thousands of entries, and the d_type
 * field classifies them without a stat() per entry. Only filesystems that report
 * DT_UNKNOWN pay for an fstatat() fallback.
 */
class DirectoryScanner {
public:
    enum class EntryType { File, Directory, Symlink, Other };

    struct Entry {
        std::string name;
        EntryType type = EntryType::Other;
        std::error_code error;  // Set when the type could not be determined
    };

    using DirectoryVisitor = std::function<void(const std::filesystem::path& dir,
                                                const std::filesystem::path& relative)>;
    using ErrorHandler = std::function<void(const std::filesystem::path& dir, std::error_code ec)>;

    /**
     * Lists the immediate entries of one directory ("." and ".." excluded).
     *
     * @param dir_path Directory to list
     * @param entries Output, appended to
     * @return Empty error_code on success, errno-based code otherwise
     */
    [[nodiscard]] static std::error_code list_directory(const std::string& dir_path,
                                                        std::vector<Entry>& entries);

    /**
     * Depth-first walk visiting every directory under root, root included
     * (relative path "."). Symlinked directories are not followed. A directory
     * that cannot be listed is reported to on_error and its subtree skipped.
     * Stops early once the token is cancelled.
     */
    static void walk_directories(const std::filesystem::path& root,
                                 const DirectoryVisitor& visitor,
                                 const ErrorHandler& on_error,
                                 const CancellationToken* token = nullptr);

    // fstatat() fallback for entries reported as DT_UNKNOWN. On failure the entry
    // stays Other and carries the errno in entry.error.
    static void classify_at(int dir_fd, Entry& entry);

    // lstat() size of a path
    [[nodiscard]] static std::error_code file_size(const std::string& path, uint64_t& size);

    // Resolves a symlink and reports whether it points at a regular file
    [[nodiscard]] static bool resolves_to_regular_file(const std::string& path, uint64_t& size);

    // Strips trailing slashes so joined paths never contain "//"
    [[nodiscard]] static std::string normalize_root(const std::filesystem::path& root);

    [[nodiscard]] static std::string join(const std::string& dir, const std::string& name);

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;  // 256KB buffer for getdents64
};

}  // namespace rapidcopy::util
