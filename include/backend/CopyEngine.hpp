#pragma once

#include "backend/Config.hpp"
#include "model/Progress.hpp"
#include "util/BoundedQueue.hpp"
#include "util/CancellationToken.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace rapidcopy::backend {

/**
 * CopyEngine: mirrors a list of files from source_root to target_root in parallel.
 *
 * Before any worker starts, the whole source directory skeleton is recreated under
 * the target so empty directories survive. Workers then take files from the fixed
 * list by atomic index and stream each one through their own reusable buffer.
 *
 * Streams (all closed once the last worker is done):
 *  - results():  one CopyResult per attempted file
 *  - progress(): periodic snapshots (dropped when full) plus one final snapshot
 *                that is always retained
 *  - errors():   per-file failures and directory preparation failures
 *
 * Cancellation is polled before each file and before each buffer-sized chunk. A
 * file interrupted mid-copy reports CopyStatus::Canceled and leaves its partial
 * destination on disk unless CopyOptions::remove_partial is set. Files never
 * started are counted as skipped and produce no result.
 */
class CopyEngine {
public:
    CopyEngine(const std::filesystem::path& source_root,
               const std::filesystem::path& target_root,
               const CopyOptions& options,
               util::CancellationToken token = util::CancellationToken());
    ~CopyEngine();

    CopyEngine(const CopyEngine&) = delete;
    CopyEngine& operator=(const CopyEngine&) = delete;

    // Fixes the totals reported in progress; call before start()
    void set_totals(uint64_t total_files, uint64_t total_bytes);

    // Launches the copy in the background. Throws std::logic_error if called twice.
    void start(std::vector<std::filesystem::path> files);
    void start(const model::FileList& list);

    void wait();
    void cancel() { token_.cancel(); }
    [[nodiscard]] bool is_cancelled() const { return token_.is_cancelled(); }

    [[nodiscard]] util::BoundedQueue<model::CopyResult>& results() { return results_; }
    [[nodiscard]] util::BoundedQueue<model::CopyProgress>& progress() { return progress_; }
    [[nodiscard]] util::BoundedQueue<model::ErrorRecord>& errors() { return errors_; }

    [[nodiscard]] model::CopyProgress snapshot() const;

    // Copies one file synchronously with a private buffer. Aggregate counters and
    // streams are left untouched.
    [[nodiscard]] model::CopyResult copy_file(const std::filesystem::path& source);

    [[nodiscard]] const std::filesystem::path& source_root() const { return source_root_; }
    [[nodiscard]] const std::filesystem::path& target_root() const { return target_root_; }

private:
    void run();
    void prepare_directories();
    void compute_totals();
    void worker_loop();

    [[nodiscard]] model::CopyResult copy_single_file(const std::filesystem::path& source,
                                                     std::vector<char>& buffer);
    [[nodiscard]] std::error_code copy_contents(const std::string& src, const std::string& dst,
                                                std::vector<char>& buffer,
                                                uint64_t& bytes_copied, std::string& stage);
    [[nodiscard]] std::error_code verify_copy(const std::string& src, const std::string& dst,
                                              std::vector<char>& buffer);
    void record(const model::CopyResult& result);
    void emit_error(model::ErrorRecord::Phase phase, const std::filesystem::path& path,
                    std::error_code ec, std::string message);

    std::filesystem::path source_root_;
    std::filesystem::path target_root_;
    CopyOptions options_;
    util::CancellationToken token_;

    util::BoundedQueue<model::CopyResult> results_;
    util::BoundedQueue<model::CopyProgress> progress_;
    util::BoundedQueue<model::ErrorRecord> errors_;

    std::vector<std::filesystem::path> files_;
    std::atomic<size_t> next_index_{0};
    std::atomic<size_t> attempted_{0};

    // Aggregate progress, one lock for a consistent multi-field read
    mutable std::mutex progress_mutex_;
    model::CopyProgress aggregate_;
    bool totals_set_ = false;

    std::chrono::steady_clock::time_point start_time_;
    std::thread coordinator_;
    bool started_ = false;
};

}  // namespace rapidcopy::backend
