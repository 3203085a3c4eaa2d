#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

namespace rapidcopy::util {

namespace {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

DirectoryScanner::EntryType classify_mode(mode_t mode) {
    if (S_ISREG(mode)) return DirectoryScanner::EntryType::File;
    if (S_ISDIR(mode)) return DirectoryScanner::EntryType::Directory;
    if (S_ISLNK(mode)) return DirectoryScanner::EntryType::Symlink;
    return DirectoryScanner::EntryType::Other;
}

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

}  // namespace

std::string DirectoryScanner::normalize_root(const std::filesystem::path& root) {
    std::string root_str = root.string();
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }
    return root_str;
}

std::string DirectoryScanner::join(const std::string& dir, const std::string& name) {
    if (!dir.empty() && dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

std::error_code DirectoryScanner::list_directory(const std::string& dir_path,
                                                 std::vector<Entry>& entries) {
    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        auto ec = last_error();
        Logger::debug("DirectoryScanner: Failed to open directory: " + dir_path + " (" + ec.message() + ")");
        return ec;
    }

    // One buffer per thread; scanner workers list directories concurrently
    alignas(linux_dirent64) static thread_local char buffer[BUFFER_SIZE];

    std::error_code result;
    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer, BUFFER_SIZE);

        if (nread == -1) {
            if (errno == EINTR) continue;
            result = last_error();
            Logger::warn("DirectoryScanner: getdents64 failed for " + dir_path + " (" + result.message() + ")");
            break;
        }

        if (nread == 0) {
            // End of directory
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            Entry entry;
            entry.name = d->d_name;

            switch (d->d_type) {
                case DT_REG: entry.type = EntryType::File; break;
                case DT_DIR: entry.type = EntryType::Directory; break;
                case DT_LNK: entry.type = EntryType::Symlink; break;
                case DT_UNKNOWN:
                    // Filesystem doesn't support d_type, fall back to stat
                    classify_at(fd, entry);
                    break;
                default: entry.type = EntryType::Other; break;
            }

            entries.push_back(std::move(entry));
        }
    }

    close(fd);
    return result;
}

void DirectoryScanner::classify_at(int dir_fd, Entry& entry) {
    struct stat entry_stat;
    if (fstatat(dir_fd, entry.name.c_str(), &entry_stat, AT_SYMLINK_NOFOLLOW) != 0) {
        entry.type = EntryType::Other;
        entry.error = last_error();
        Logger::warn("DirectoryScanner: Cannot stat " + entry.name + " (" + entry.error.message() + ")");
        return;
    }
    entry.type = classify_mode(entry_stat.st_mode);
}

void DirectoryScanner::walk_directories(const std::filesystem::path& root,
                                        const DirectoryVisitor& visitor,
                                        const ErrorHandler& on_error,
                                        const CancellationToken* token) {
    const std::string root_str = normalize_root(root);

    struct Pending {
        std::string path;
        std::filesystem::path relative;
    };
    std::vector<Pending> stack;
    stack.push_back({root_str, "."});

    std::vector<Entry> entries;
    while (!stack.empty()) {
        if (token && token->is_cancelled()) {
            Logger::info("DirectoryScanner: Directory walk cancelled");
            return;
        }

        Pending current = std::move(stack.back());
        stack.pop_back();

        visitor(current.path, current.relative);

        entries.clear();
        if (auto ec = list_directory(current.path, entries)) {
            if (on_error) on_error(current.path, ec);
            continue;
        }

        for (const auto& entry : entries) {
            if (entry.type != EntryType::Directory) continue;
            auto relative = current.relative == "." ? std::filesystem::path(entry.name)
                                                    : current.relative / entry.name;
            stack.push_back({join(current.path, entry.name), std::move(relative)});
        }
    }
}

std::error_code DirectoryScanner::file_size(const std::string& path, uint64_t& size) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return last_error();
    }
    size = static_cast<uint64_t>(st.st_size);
    return {};
}

bool DirectoryScanner::resolves_to_regular_file(const std::string& path, uint64_t& size) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    size = static_cast<uint64_t>(st.st_size);
    return true;
}

}  // namespace rapidcopy::util
