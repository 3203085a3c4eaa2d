#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace rapidcopy::backend {

struct ScanOptions {
    int workers = 8;
    std::chrono::milliseconds tick_interval{500};
    bool collect_sizes = false;      // Opt-in: costs one lstat() per file
    bool follow_symlinks = false;    // Emit symlinks that resolve to regular files
    size_t dir_queue_depth = 1024;
    size_t file_queue_depth = 1000;
    size_t progress_queue_depth = 100;
    size_t error_queue_depth = 100;
};

struct CopyOptions {
    int workers = 4;
    size_t buffer_size = 1024 * 1024;  // Per-worker buffer
    std::chrono::milliseconds tick_interval{500};
    bool verify = false;               // SHA-256 compare source and destination
    bool remove_partial = false;       // Unlink destination on failure/cancel
    size_t result_queue_depth = 1000;
    size_t progress_queue_depth = 100;
    size_t error_queue_depth = 100;
};

struct Config {
    ScanOptions scan;
    CopyOptions copy;

    // Logging
    std::string log_level = "info";
    std::filesystem::path log_file = "/tmp/rapidcopy.log";

    static constexpr std::chrono::milliseconds MIN_SCAN_TICK{10};
    static constexpr std::chrono::milliseconds MIN_COPY_TICK{100};
    static constexpr int MAX_WORKERS = 256;             // Per pool
    static constexpr size_t MAX_BUFFER_MB = 1024;
    static constexpr size_t MAX_BUFFER_SIZE = MAX_BUFFER_MB * 1024 * 1024;
};

class ConfigLoader {
public:
    // Defaults, then the config file if present, then environment overrides
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static void apply_env_overrides(Config& cfg);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();

private:
    static void apply_setting(Config& cfg, const std::string& section,
                              const std::string& key, const std::string& value);
    static void clamp(Config& cfg);
};

}  // namespace rapidcopy::backend
