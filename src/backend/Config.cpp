#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>

namespace rapidcopy::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

bool parse_int(const std::string& key, const std::string& value, long long& out) {
    long long parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        util::Logger::warn("Config: Ignoring invalid integer for " + key + ": \"" + value + "\"");
        return false;
    }
    out = parsed;
    return true;
}

bool parse_bool(const std::string& key, const std::string& value, bool& out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "y") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "n") {
        out = false;
        return true;
    }
    util::Logger::warn("Config: Ignoring invalid boolean for " + key + ": \"" + value + "\"");
    return false;
}

void set_int(const std::string& key, const std::string& value, int& field) {
    long long n = 0;
    if (parse_int(key, value, n)) {
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            util::Logger::warn("Config: " + key + " out of range, keeping " + std::to_string(field));
            return;
        }
        field = static_cast<int>(n);
    }
}

void set_size(const std::string& key, const std::string& value, size_t& field) {
    long long n = 0;
    if (parse_int(key, value, n)) {
        if (n < 1) {
            util::Logger::warn("Config: " + key + " must be positive, keeping " + std::to_string(field));
            return;
        }
        field = static_cast<size_t>(n);
    }
}

void set_ms(const std::string& key, const std::string& value, std::chrono::milliseconds& field) {
    long long n = 0;
    if (parse_int(key, value, n)) field = std::chrono::milliseconds(n);
}

void set_bool(const std::string& key, const std::string& value, bool& field) {
    bool b = false;
    if (parse_bool(key, value, b)) field = b;
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    Config cfg;
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        cfg = load_from_file(config_file);
    } else {
        cfg = create_default_config();
    }

    apply_env_overrides(cfg);
    clamp(cfg);
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring malformed line: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Trailing comment after an unquoted value
        if (!value.empty() && value.front() != '"') {
            auto hash = value.find('#');
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        apply_setting(cfg, current_section, key, value);
    }

    clamp(cfg);
    return cfg;
}

void ConfigLoader::apply_setting(Config& cfg, const std::string& section,
                                 const std::string& key, const std::string& value) {
    const std::string qualified = section + "." + key;

    if (section == "scan") {
        if (key == "workers") set_int(qualified, value, cfg.scan.workers);
        else if (key == "tick_ms") set_ms(qualified, value, cfg.scan.tick_interval);
        else if (key == "collect_sizes") set_bool(qualified, value, cfg.scan.collect_sizes);
        else if (key == "follow_symlinks") set_bool(qualified, value, cfg.scan.follow_symlinks);
        else if (key == "dir_queue_depth") set_size(qualified, value, cfg.scan.dir_queue_depth);
        else if (key == "file_queue_depth") set_size(qualified, value, cfg.scan.file_queue_depth);
        else if (key == "progress_queue_depth") set_size(qualified, value, cfg.scan.progress_queue_depth);
        else if (key == "error_queue_depth") set_size(qualified, value, cfg.scan.error_queue_depth);
        else util::Logger::warn("Config: Unknown key " + qualified);
    }
    else if (section == "copy") {
        if (key == "workers") set_int(qualified, value, cfg.copy.workers);
        else if (key == "buffer_size_mb") {
            long long mb = 0;
            if (parse_int(qualified, value, mb)) {
                if (mb < 1) {
                    util::Logger::warn("Config: " + qualified + " must be positive, keeping " +
                                       std::to_string(cfg.copy.buffer_size / (1024 * 1024)));
                } else if (static_cast<unsigned long long>(mb) > Config::MAX_BUFFER_MB) {
                    util::Logger::warn("Config: " + qualified + " capped at " +
                                       std::to_string(Config::MAX_BUFFER_MB));
                    cfg.copy.buffer_size = Config::MAX_BUFFER_SIZE;
                } else {
                    cfg.copy.buffer_size = static_cast<size_t>(mb) * 1024 * 1024;
                }
            }
        }
        else if (key == "tick_ms") set_ms(qualified, value, cfg.copy.tick_interval);
        else if (key == "verify") set_bool(qualified, value, cfg.copy.verify);
        else if (key == "remove_partial") set_bool(qualified, value, cfg.copy.remove_partial);
        else if (key == "result_queue_depth") set_size(qualified, value, cfg.copy.result_queue_depth);
        else if (key == "progress_queue_depth") set_size(qualified, value, cfg.copy.progress_queue_depth);
        else if (key == "error_queue_depth") set_size(qualified, value, cfg.copy.error_queue_depth);
        else util::Logger::warn("Config: Unknown key " + qualified);
    }
    else if (section == "log") {
        if (key == "level") cfg.log_level = value;
        else if (key == "file") cfg.log_file = value;
        else util::Logger::warn("Config: Unknown key " + qualified);
    }
    else {
        util::Logger::warn("Config: Unknown section [" + section + "]");
    }
}

void ConfigLoader::apply_env_overrides(Config& cfg) {
    struct EnvKey {
        const char* name;
        const char* section;
        const char* key;
    };
    static constexpr EnvKey keys[] = {
        {"SCANNER_CONCURRENCY", "scan", "workers"},
        {"SCANNER_TICK_MS", "scan", "tick_ms"},
        {"SCANNER_COLLECT_SIZE", "scan", "collect_sizes"},
        {"SCANNER_FOLLOW_SYMLINKS", "scan", "follow_symlinks"},
        {"SCANNER_DIRBUF", "scan", "dir_queue_depth"},
        {"SCANNER_FILES_BUF", "scan", "file_queue_depth"},
        {"SCANNER_PROGRESS_BUF", "scan", "progress_queue_depth"},
        {"SCANNER_ERR_BUF", "scan", "error_queue_depth"},
        {"COPIER_CONCURRENCY", "copy", "workers"},
        {"COPIER_BUFFER_MB", "copy", "buffer_size_mb"},
        {"COPIER_TICK_MS", "copy", "tick_ms"},
        {"COPIER_VERIFY", "copy", "verify"},
        {"COPIER_REMOVE_PARTIAL", "copy", "remove_partial"},
        {"RAPIDCOPY_LOG_LEVEL", "log", "level"},
        {"RAPIDCOPY_LOG_FILE", "log", "file"},
    };

    for (const auto& k : keys) {
        const char* value = std::getenv(k.name);
        if (!value) continue;
        util::Logger::debug(std::string("Config: Environment override ") + k.name + "=" + value);
        apply_setting(cfg, k.section, k.key, trim(value));
    }
    clamp(cfg);
}

void ConfigLoader::clamp(Config& cfg) {
    auto clamp_workers = [](const char* key, int& workers) {
        if (workers > Config::MAX_WORKERS) {
            util::Logger::warn(std::string("Config: ") + key + " = " + std::to_string(workers) +
                               " capped at " + std::to_string(Config::MAX_WORKERS));
            workers = Config::MAX_WORKERS;
        }
        workers = std::max(1, workers);
    };
    clamp_workers("scan.workers", cfg.scan.workers);
    clamp_workers("copy.workers", cfg.copy.workers);

    if (cfg.copy.buffer_size > Config::MAX_BUFFER_SIZE) {
        util::Logger::warn("Config: copy buffer capped at " + std::to_string(Config::MAX_BUFFER_MB) + "MB");
        cfg.copy.buffer_size = Config::MAX_BUFFER_SIZE;
    }
    cfg.scan.tick_interval = std::max(cfg.scan.tick_interval, Config::MIN_SCAN_TICK);
    cfg.copy.tick_interval = std::max(cfg.copy.tick_interval, Config::MIN_COPY_TICK);
    if (cfg.copy.buffer_size == 0) cfg.copy.buffer_size = 1024 * 1024;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return false;
    }

    auto b = [](bool v) { return v ? "true" : "false"; };

    file << "# RAPIDCOPY Config\n";
    file << "# Environment variables (SCANNER_*, COPIER_*, RAPIDCOPY_*) override these values\n\n";

    file << "[scan]\n";
    file << "# Directory listing threads\n";
    file << "workers = " << cfg.scan.workers << "\n";
    file << "# Progress sampling interval in milliseconds (min 10)\n";
    file << "tick_ms = " << cfg.scan.tick_interval.count() << "\n";
    file << "# Stat every file for its size (slower scan, byte totals)\n";
    file << "collect_sizes = " << b(cfg.scan.collect_sizes) << "\n";
    file << "follow_symlinks = " << b(cfg.scan.follow_symlinks) << "\n";
    file << "dir_queue_depth = " << cfg.scan.dir_queue_depth << "\n";
    file << "file_queue_depth = " << cfg.scan.file_queue_depth << "\n";
    file << "progress_queue_depth = " << cfg.scan.progress_queue_depth << "\n";
    file << "error_queue_depth = " << cfg.scan.error_queue_depth << "\n\n";

    file << "[copy]\n";
    file << "workers = " << cfg.copy.workers << "\n";
    file << "# Per-worker copy buffer\n";
    file << "buffer_size_mb = " << std::max<size_t>(1, cfg.copy.buffer_size / (1024 * 1024)) << "\n";
    file << "# Progress sampling interval in milliseconds (min 100)\n";
    file << "tick_ms = " << cfg.copy.tick_interval.count() << "\n";
    file << "# Re-read both files and compare SHA-256 digests after each copy\n";
    file << "verify = " << b(cfg.copy.verify) << "\n";
    file << "# Delete partially written files after a failure or cancel\n";
    file << "remove_partial = " << b(cfg.copy.remove_partial) << "\n";
    file << "result_queue_depth = " << cfg.copy.result_queue_depth << "\n";
    file << "progress_queue_depth = " << cfg.copy.progress_queue_depth << "\n";
    file << "error_queue_depth = " << cfg.copy.error_queue_depth << "\n\n";

    file << "[log]\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.scan.workers = util::Platform::default_scan_workers();
    cfg.copy.workers = util::Platform::default_copy_workers();
    return cfg;
}

}  // namespace rapidcopy::backend
