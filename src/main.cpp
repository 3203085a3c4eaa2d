#include "backend/Config.hpp"
#include "collectors/CopyManager.hpp"
#include "ui/Formatting.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;
namespace rc = rapidcopy;

// Set from the signal handler, turned into a cancel by the watcher thread
static std::atomic<bool> g_interrupted{false};

static void signal_handler(int) {
    g_interrupted.store(true);
    // A second Ctrl+C terminates immediately
    std::signal(SIGINT, SIG_DFL);
}

static int terminal_width() {
    struct winsize ws {};
    if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
    return 100;
}

static int exit_code(rc::collectors::RunStatus status) {
    switch (status) {
        case rc::collectors::RunStatus::Completed:           return 0;
        case rc::collectors::RunStatus::Failed:              return 1;
        case rc::collectors::RunStatus::CompletedWithErrors: return 2;
        case rc::collectors::RunStatus::Canceled:            return 130;
    }
    return 1;
}

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: " << (argc > 0 ? argv[0] : "rapidcopy") << " <source-dir> <target-dir>\n";
        return 1;
    }

    try {
        rc::util::Logger::init();
        auto config = rc::backend::ConfigLoader::load_config();
        if (config.log_file != rc::backend::Config{}.log_file) {
            rc::util::Logger::init(config.log_file);
        }
        rc::util::Logger::Level level;
        if (rc::util::Logger::parse_level(config.log_level, level)) {
            rc::util::Logger::set_level(level);
        } else {
            rc::util::Logger::warn("Unknown log level \"" + config.log_level + "\", using info");
        }
        rc::util::Logger::info("RAPIDCOPY starting...");

        std::filesystem::path source = argv[1];
        std::filesystem::path target = argv[2];

        std::cout << "Source: " << source.string() << "\n";
        std::cout << "Target: " << target.string() << "\n\n";

        rc::collectors::CopyManager manager(source, target, config);

        const int width = terminal_width();
        std::mutex print_mutex;

        manager.set_on_scan_progress([&](const rc::model::ScanProgress& p) {
            std::lock_guard<std::mutex> lock(print_mutex);
            std::cout << '\r' << rc::ui::scan_status_line(p, width - 1) << std::flush;
        });
        manager.set_on_copy_progress([&](const rc::model::CopyProgress& p) {
            std::lock_guard<std::mutex> lock(print_mutex);
            std::cout << '\r' << rc::ui::copy_status_line(p, width - 1) << std::flush;
        });
        manager.set_on_error([&](const rc::model::ErrorRecord& e) {
            std::lock_guard<std::mutex> lock(print_mutex);
            std::cerr << "\nerror: " << e.describe() << "\n";
        });

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::jthread interrupt_watcher([&manager](std::stop_token st) {
            while (!st.stop_requested()) {
                if (g_interrupted.load()) {
                    rc::util::Logger::info("Interrupt received, cancelling");
                    manager.cancel();
                    return;
                }
                std::this_thread::sleep_for(50ms);
            }
        });

        auto summary = manager.run();
        interrupt_watcher.request_stop();

        std::cout << "\n\n";
        if (summary.status == rc::collectors::RunStatus::Failed) {
            std::cerr << "Copy failed: " << summary.failure_reason << "\n";
        } else {
            const auto& c = summary.last_copy;
            std::cout << "Copy " << rc::collectors::to_string(summary.status) << ": "
                      << c.completed_files << "/" << summary.files_found << " files, "
                      << rc::ui::format_bytes(c.completed_bytes) << " in "
                      << rc::ui::format_duration(summary.last_scan.elapsed + c.elapsed) << "\n";
            if (c.failed_files > 0 || c.skipped_files > 0) {
                std::cout << "  failed: " << c.failed_files << ", skipped: " << c.skipped_files << "\n";
            }
            if (summary.error_count > 0) {
                std::cout << "  errors reported: " << summary.error_count
                          << " (see " << config.log_file.string() << ")\n";
            }
        }

        rc::util::Logger::info(std::string("RAPIDCOPY finished: ") + rc::collectors::to_string(summary.status));
        return exit_code(summary.status);
    } catch (const std::exception& e) {
        rc::util::Logger::error(std::string("Fatal: ") + e.what());
        std::cerr << "rapidcopy: " << e.what() << "\n";
        return 1;
    }
}
