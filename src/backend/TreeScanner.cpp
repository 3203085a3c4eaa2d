#include "backend/TreeScanner.hpp"
#include "events/Ticker.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace rapidcopy::backend {

using util::DirectoryScanner;
using util::Logger;

TreeScanner::TreeScanner(const ScanOptions& options, util::CancellationToken token)
    : options_(options),
      token_(std::move(token)),
      files_(std::max<size_t>(1, options.file_queue_depth)),
      progress_(std::max<size_t>(1, options.progress_queue_depth)),
      errors_(std::max<size_t>(1, options.error_queue_depth)),
      dir_queue_(std::max<size_t>(1, options.dir_queue_depth)) {
    options_.workers = std::clamp(options_.workers, 1, Config::MAX_WORKERS);
}

TreeScanner::~TreeScanner() {
    if (coordinator_.joinable()) {
        // Nobody may be draining anymore: unblock any worker stuck on a full stream
        token_.cancel();
        files_.close();
        errors_.close();
        progress_.close();
        coordinator_.join();
    }
}

void TreeScanner::start(const std::filesystem::path& root) {
    if (started_) {
        throw std::logic_error("TreeScanner::start called twice");
    }
    started_ = true;

    std::error_code ec;
    auto absolute_root = std::filesystem::absolute(root, ec);
    if (ec) absolute_root = root;

    start_time_ = std::chrono::steady_clock::now();
    coordinator_ = std::thread([this, r = DirectoryScanner::normalize_root(absolute_root)]() {
        run(r);
    });
}

void TreeScanner::wait() {
    if (coordinator_.joinable()) {
        coordinator_.join();
    }
}

model::ScanProgress TreeScanner::snapshot() const {
    model::ScanProgress progress;
    progress.total_files = total_files_.load(std::memory_order_relaxed);
    progress.total_bytes = total_bytes_.load(std::memory_order_relaxed);

    auto elapsed = std::chrono::steady_clock::now() - start_time_;
    progress.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
    double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds > 0) {
        progress.files_per_second = static_cast<double>(progress.total_files) / seconds;
    }
    return progress;
}

void TreeScanner::run(std::string root) {
    Logger::info("TreeScanner: Scanning " + root + " with " + std::to_string(options_.workers) +
                 " workers (sizes " + (options_.collect_sizes ? "on" : "off") + ")");

    events::Ticker ticker("scan", options_.tick_interval, [this]() {
        // Telemetry only: a lagging consumer loses ticks, workers never wait
        if (!progress_.try_push(snapshot())) {
            Logger::debug("TreeScanner: Progress tick dropped");
        }
    });
    ticker.start();

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        if (!ec) ec = std::make_error_code(std::errc::not_a_directory);
        emit_error(root, ec, "scan root is not a directory");
    } else {
        // Seed before any worker can observe the counter
        pending_.add(1);
        dir_queue_.push(root);

        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(options_.workers));
        try {
            for (int i = 0; i < options_.workers; ++i) {
                workers.emplace_back([this]() { worker_loop(); });
            }
        } catch (const std::system_error& e) {
            Logger::warn("TreeScanner: Started " + std::to_string(workers.size()) + " of " +
                         std::to_string(options_.workers) + " workers: " + e.what());
            if (workers.empty()) {
                emit_error(root, e.code(), "cannot start scan workers");
            }
        }

        if (workers.empty()) {
            // Nobody will process the root; release its pending slot ourselves
            dir_queue_.close();
            while (dir_queue_.try_pop()) {
                pending_.done();
            }
        } else {
            // Every discovered directory processed (or skipped on cancel)
            pending_.wait();
            dir_queue_.close();
        }

        for (auto& worker : workers) {
            worker.join();
        }
    }

    ticker.stop();

    auto final_progress = snapshot();
    progress_.push_latest(final_progress);

    files_.close();
    errors_.close();
    progress_.close();

    Logger::info("TreeScanner: " + std::string(token_.is_cancelled() ? "Cancelled" : "Finished") +
                 " after " + std::to_string(final_progress.total_files) + " files in " +
                 std::to_string(final_progress.elapsed.count()) + "ms");
}

void TreeScanner::worker_loop() {
    // Subdirectories that didn't fit into the shared queue stay with this worker
    std::vector<std::string> overflow;

    while (auto dir = dir_queue_.pop()) {
        overflow.push_back(std::move(*dir));
        while (!overflow.empty()) {
            std::string current = std::move(overflow.back());
            overflow.pop_back();

            process_directory(current, overflow);
            pending_.done();
        }
    }
}

void TreeScanner::process_directory(const std::string& dir, std::vector<std::string>& overflow) {
    if (token_.is_cancelled()) {
        return;
    }

    std::vector<DirectoryScanner::Entry> entries;
    if (auto ec = DirectoryScanner::list_directory(dir, entries)) {
        emit_error(dir, ec, "cannot list directory");
        return;
    }

    for (const auto& entry : entries) {
        if (token_.is_cancelled()) {
            break;
        }

        std::string path = DirectoryScanner::join(dir, entry.name);

        switch (entry.type) {
            case DirectoryScanner::EntryType::Directory:
                pending_.add(1);
                if (!dir_queue_.try_push(path)) {
                    overflow.push_back(std::move(path));
                }
                break;

            case DirectoryScanner::EntryType::File: {
                uint64_t size = 0;
                if (options_.collect_sizes) {
                    if (auto ec = DirectoryScanner::file_size(path, size)) {
                        emit_error(path, ec, "cannot stat file");
                        break;
                    }
                }
                emit_file(path, dir, size);
                break;
            }

            case DirectoryScanner::EntryType::Symlink: {
                uint64_t size = 0;
                if (options_.follow_symlinks && DirectoryScanner::resolves_to_regular_file(path, size)) {
                    emit_file(path, dir, options_.collect_sizes ? size : 0);
                } else {
                    Logger::debug("TreeScanner: Skipping symlink " + path);
                }
                break;
            }

            case DirectoryScanner::EntryType::Other:
                if (entry.error) {
                    emit_error(path, entry.error, "cannot determine entry type");
                } else {
                    Logger::debug("TreeScanner: Skipping special file " + path);
                }
                break;
        }
    }
}

void TreeScanner::emit_file(const std::string& path, const std::string& dir, uint64_t size) {
    if (token_.is_cancelled()) {
        return;
    }

    total_files_.fetch_add(1, std::memory_order_relaxed);
    if (options_.collect_sizes) {
        total_bytes_.fetch_add(size, std::memory_order_relaxed);
    }

    files_.push(model::FileRecord{path, size, dir});
}

void TreeScanner::emit_error(const std::string& path, std::error_code ec, std::string message) {
    Logger::warn("TreeScanner: " + message + ": " + path + " (" + ec.message() + ")");
    errors_.push(model::ErrorRecord{model::ErrorRecord::Phase::Scan, path, ec, std::move(message)});
}

}  // namespace rapidcopy::backend
