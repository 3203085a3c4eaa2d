#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace rapidcopy::model {

struct ScanProgress {
    uint64_t total_files = 0;
    uint64_t total_bytes = 0;  // Only accumulated when size collection is enabled
    std::chrono::milliseconds elapsed{0};
    double files_per_second = 0.0;
};

struct FileRecord {
    std::filesystem::path path;        // Absolute (or root-joined) path
    uint64_t size = 0;                 // 0 when size collection is disabled
    std::filesystem::path parent_dir;
};

// Materialized scan output, handed from the scan phase to the copy phase
struct FileList {
    std::vector<FileRecord> files;     // Discovery order, not stable across runs
    uint64_t total_files = 0;
    uint64_t total_bytes = 0;
    bool sizes_known = false;
};

struct CopyProgress {
    uint64_t completed_files = 0;
    uint64_t failed_files = 0;
    uint64_t skipped_files = 0;
    uint64_t completed_bytes = 0;
    uint64_t total_files = 0;
    uint64_t total_bytes = 0;

    // Advisory: the file some worker started most recently, may be stale
    std::string current_file;

    double files_per_second = 0.0;
    double bytes_per_second = 0.0;
    std::chrono::milliseconds elapsed{0};
    std::chrono::milliseconds estimated_remaining{0};
};

enum class CopyStatus {
    Copied,
    Failed,
    Canceled,
};

struct CopyResult {
    std::filesystem::path path;
    std::filesystem::path destination;
    CopyStatus status = CopyStatus::Failed;
    std::error_code error;
    std::string message;
    uint64_t bytes_copied = 0;

    [[nodiscard]] bool success() const { return status == CopyStatus::Copied; }
};

struct ErrorRecord {
    enum class Phase {
        Scan,
        Prepare,
        Copy,
        Verify,
    };

    Phase phase = Phase::Scan;
    std::filesystem::path path;
    std::error_code code;
    std::string message;

    // "copy: /src/a.txt: open source failed: Permission denied"
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] const char* to_string(ErrorRecord::Phase phase);
[[nodiscard]] const char* to_string(CopyStatus status);

}  // namespace rapidcopy::model
