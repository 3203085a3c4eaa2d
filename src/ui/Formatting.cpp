#include "ui/Formatting.hpp"
#include <algorithm>
#include <array>
#include <format>

namespace rapidcopy::ui {

namespace {

// Byte length of the UTF-8 sequence introduced by `c`
int utf8_len(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;  // Invalid lead byte, treat as a single column
}

// Returns the end of a CSI sequence starting at i, or i when there is none
size_t skip_csi(const std::string& s, size_t i) {
    if (s[i] != '\x1B' || i + 1 >= s.size() || s[i + 1] != '[') return i;
    i += 2;
    while (i < s.size() && (s[i] < '@' || s[i] > '~')) {
        i++;
    }
    if (i < s.size()) i++;  // Final byte
    return i;
}

}  // namespace

int display_cols(const std::string& s) {
    int cols = 0;
    for (size_t i = 0; i < s.size();) {
        size_t end = skip_csi(s, i);
        if (end != i) {
            i = end;
            continue;
        }
        i += static_cast<size_t>(utf8_len(static_cast<unsigned char>(s[i])));
        cols++;
    }
    return cols;
}

std::string take_cols(const std::string& s, int cols) {
    if (cols <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    size_t i = 0;

    while (i < s.size() && seen < cols) {
        size_t end = skip_csi(s, i);
        if (end != i) {
            out.append(s, i, end - i);
            i = end;
            continue;
        }

        size_t len = static_cast<size_t>(utf8_len(static_cast<unsigned char>(s[i])));
        if (i + len > s.size()) len = 1;
        out.append(s, i, len);
        i += len;
        seen++;
    }

    return out;
}

std::string trunc_pad(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);

    if (cols == w) {
        return s; // Perfect fit
    }

    if (cols < w) {
        return s + std::string(static_cast<size_t>(w - cols), ' ');
    }

    if (w <= 1) {
        return take_cols(s, w);
    }

    return take_cols(s, w - 1) + "…";
}

std::string trunc_left(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);
    if (cols <= w) return s;
    if (w == 1) return "…";

    // Walk forward until the remaining tail fits into w - 1 columns
    int to_skip = cols - (w - 1);
    size_t i = 0;
    while (i < s.size() && to_skip > 0) {
        i += static_cast<size_t>(utf8_len(static_cast<unsigned char>(s[i])));
        to_skip--;
    }
    return "…" + s.substr(std::min(i, s.size()));
}

std::string format_bytes(uint64_t bytes) {
    static constexpr std::array<const char*, 6> units = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};

    if (bytes < 1024) {
        return std::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        unit++;
    }
    return std::format("{:.1f} {}", value, units[unit]);
}

std::string format_rate(double bytes_per_second) {
    if (bytes_per_second <= 0) return "0 B/s";
    return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

std::string format_duration(std::chrono::milliseconds duration) {
    auto total = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    if (total < 0) total = 0;

    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    if (hours > 0) return std::format("{}h {:02}m {:02}s", hours, minutes, seconds);
    if (minutes > 0) return std::format("{}m {:02}s", minutes, seconds);
    return std::format("{}s", seconds);
}

std::string progress_bar(double fraction, int width) {
    if (width <= 0) return "[]";
    fraction = std::clamp(fraction, 0.0, 1.0);
    int filled = static_cast<int>(fraction * width + 0.5);
    return "[" + std::string(static_cast<size_t>(filled), '#') +
           std::string(static_cast<size_t>(width - filled), '-') + "]";
}

std::string scan_status_line(const model::ScanProgress& progress, int width) {
    std::string line = std::format("Scanning: {} files", progress.total_files);
    if (progress.total_bytes > 0) {
        line += " (" + format_bytes(progress.total_bytes) + ")";
    }
    line += std::format(", {:.1f} files/s, {}", progress.files_per_second,
                        format_duration(progress.elapsed));
    return trunc_pad(line, width);
}

std::string copy_status_line(const model::CopyProgress& progress, int width) {
    double fraction = progress.total_files > 0
        ? static_cast<double>(progress.completed_files + progress.failed_files) /
              static_cast<double>(progress.total_files)
        : 0.0;

    std::string line = std::format("{} {:5.1f}% {}/{} files", progress_bar(fraction, 20),
                                   fraction * 100.0, progress.completed_files, progress.total_files);
    if (progress.failed_files > 0) {
        line += std::format(" ({} failed)", progress.failed_files);
    }
    line += ", " + format_rate(progress.bytes_per_second);
    line += ", ETA " + format_duration(progress.estimated_remaining);

    int used = display_cols(line);
    if (!progress.current_file.empty() && width - used > 8) {
        line += " " + trunc_left(progress.current_file, width - used - 1);
    }
    return trunc_pad(line, width);
}

} // namespace rapidcopy::ui
