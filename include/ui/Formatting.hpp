#pragma once

#include "model/Progress.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace rapidcopy::ui {

/**
 * Calculate the display width of a string, accounting for:
 * - ANSI CSI escape sequences (which don't take visual space)
 * - UTF-8 multi-byte characters (each counts as 1 display column)
 */
int display_cols(const std::string& s);

/**
 * Truncate a string to fit exactly `width` display columns.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Truncate string if too long (trailing "…"), pad with spaces if too short.
 * Result will be exactly `width` display columns.
 */
std::string trunc_pad(const std::string& s, int width);

/**
 * Keep the tail of a path: "…/deep/dir/file.txt". Useful when the file name
 * matters more than the root.
 */
std::string trunc_left(const std::string& s, int width);

// 0 B, 512 B, 1.5 KiB, 3.0 MiB ...
std::string format_bytes(uint64_t bytes);

// "12.3 MiB/s"
std::string format_rate(double bytes_per_second);

// "45s", "3m 07s", "1h 02m 03s"
std::string format_duration(std::chrono::milliseconds duration);

// "[#####-----]" with `width` cells between the brackets
std::string progress_bar(double fraction, int width);

std::string scan_status_line(const model::ScanProgress& progress, int width);
std::string copy_status_line(const model::CopyProgress& progress, int width);

} // namespace rapidcopy::ui
