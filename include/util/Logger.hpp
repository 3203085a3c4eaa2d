#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace rapidcopy::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens (truncates) the log file. Safe to call again to switch files.
    static void init(const std::filesystem::path& path = "/tmp/rapidcopy.log");
    static void set_level(Level level);
    [[nodiscard]] static Level level();

    // Accepts "debug", "info", "warn"/"warning", "error" (any case).
    [[nodiscard]] static bool parse_level(std::string_view text, Level& out);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace rapidcopy::util
