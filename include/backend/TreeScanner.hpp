#pragma once

#include "backend/Config.hpp"
#include "model/Progress.hpp"
#include "util/BoundedQueue.hpp"
#include "util/CancellationToken.hpp"
#include "util/WaitGroup.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace rapidcopy::backend {

/**
 * TreeScanner: parallel file discovery over a directory tree.
 *
 * A fixed pool of workers drains a bounded queue of directories. Each worker lists
 * one directory, queues its subdirectories and emits its files. A pending-count
 * seeded with 1 for the root tracks discovered-but-unprocessed directories; when it
 * reaches zero the directory queue is closed and the pool exits.
 *
 * Output is three streams that all close when the scan is over:
 *  - files():    every regular file, blocking send (a lost file corrupts the list)
 *  - progress(): periodic snapshots, dropped when the consumer lags
 *  - errors():   non-fatal listing/stat failures, blocking send
 *
 * Consumers must drain files() and errors() concurrently; a full error stream stalls
 * the workers just like a full file stream does.
 */
class TreeScanner {
public:
    explicit TreeScanner(const ScanOptions& options,
                         util::CancellationToken token = util::CancellationToken());
    ~TreeScanner();

    TreeScanner(const TreeScanner&) = delete;
    TreeScanner& operator=(const TreeScanner&) = delete;

    // Launches the scan in the background. Throws std::logic_error if called twice.
    void start(const std::filesystem::path& root);

    // Blocks until the scan finished and all streams are closed
    void wait();

    // Cooperative: checked per directory, between entries and before each emit
    void cancel() { token_.cancel(); }
    [[nodiscard]] bool is_cancelled() const { return token_.is_cancelled(); }

    [[nodiscard]] util::BoundedQueue<model::FileRecord>& files() { return files_; }
    [[nodiscard]] util::BoundedQueue<model::ScanProgress>& progress() { return progress_; }
    [[nodiscard]] util::BoundedQueue<model::ErrorRecord>& errors() { return errors_; }

    [[nodiscard]] uint64_t files_seen() const { return total_files_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t bytes_seen() const { return total_bytes_.load(std::memory_order_relaxed); }
    [[nodiscard]] int worker_count() const { return options_.workers; }

    [[nodiscard]] model::ScanProgress snapshot() const;

private:
    void run(std::string root);
    void worker_loop();
    void process_directory(const std::string& dir, std::vector<std::string>& overflow);
    void emit_file(const std::string& path, const std::string& dir, uint64_t size);
    void emit_error(const std::string& path, std::error_code ec, std::string message);

    ScanOptions options_;
    util::CancellationToken token_;

    util::BoundedQueue<model::FileRecord> files_;
    util::BoundedQueue<model::ScanProgress> progress_;
    util::BoundedQueue<model::ErrorRecord> errors_;

    util::BoundedQueue<std::string> dir_queue_;
    util::WaitGroup pending_;

    std::atomic<uint64_t> total_files_{0};
    std::atomic<uint64_t> total_bytes_{0};

    std::chrono::steady_clock::time_point start_time_;
    std::thread coordinator_;
    bool started_ = false;
};

}  // namespace rapidcopy::backend
