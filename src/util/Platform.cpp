#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <thread>

namespace rapidcopy::util {

std::filesystem::path Platform::get_config_directory() {
    Logger::debug("Platform: Detecting config directory");
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "rapidcopy";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "rapidcopy";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/rapidcopy");
    return ".config/rapidcopy";
}

unsigned int Platform::cpu_count() {
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 4 : n;
}

int Platform::default_scan_workers() {
    return std::clamp(static_cast<int>(cpu_count()) * 4, 8, 256);
}

int Platform::default_copy_workers() {
    return std::clamp(static_cast<int>(cpu_count()) * 2, 4, 16);
}

namespace {

std::filesystem::path resolve(const std::filesystem::path& p) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(p, ec);
    if (ec) {
        return p.lexically_normal();
    }
    return resolved;
}

}  // namespace

bool Platform::is_within(const std::filesystem::path& inner, const std::filesystem::path& outer) {
    auto rel = resolve(inner).lexically_relative(resolve(outer));
    if (rel.empty()) return false;
    return *rel.begin() != "..";
}

}  // namespace rapidcopy::util
