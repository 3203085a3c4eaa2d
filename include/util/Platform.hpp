#pragma once

#include <filesystem>

namespace rapidcopy::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();

    // hardware_concurrency() with a fallback of 4 when the runtime can't tell
    static unsigned int cpu_count();

    // clamp(4 x CPUs, 8, 256): listing is syscall bound, oversubscription pays off
    static int default_scan_workers();

    // clamp(2 x CPUs, 4, 16)
    static int default_copy_workers();

    // True if `inner` is `outer` or lies underneath it, symlinks resolved where the paths exist
    static bool is_within(const std::filesystem::path& inner, const std::filesystem::path& outer);
};

}  // namespace rapidcopy::util
