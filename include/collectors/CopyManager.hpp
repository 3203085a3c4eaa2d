#pragma once

#include "backend/Config.hpp"
#include "model/Progress.hpp"
#include "util/CancellationToken.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <string>

namespace rapidcopy::collectors {

enum class RunStatus {
    Completed,
    CompletedWithErrors,
    Canceled,
    Failed,
};

[[nodiscard]] const char* to_string(RunStatus status);

struct CopySummary {
    RunStatus status = RunStatus::Completed;
    uint64_t files_found = 0;
    uint64_t bytes_found = 0;  // Scan-time sizes, 0 unless size collection is on
    model::ScanProgress last_scan;
    model::CopyProgress last_copy;
    size_t error_count = 0;
    std::string failure_reason;  // Set when status == Failed
};

/**
 * CopyManager: chains scan -> collect -> copy for one source/target pair.
 *
 * Every stream of both phases is drained on its own thread while the calling
 * thread collects files (scan) or results (copy). Callbacks therefore run on
 * different threads and may overlap; they must be cheap and thread-safe.
 *
 * Progress and error callbacks must not throw. An exception from on_file or
 * on_result cancels the run, the remaining stream is drained so the workers can
 * exit, and the exception propagates out of run().
 */
class CopyManager {
public:
    using ScanProgressCallback = std::function<void(const model::ScanProgress&)>;
    using CopyProgressCallback = std::function<void(const model::CopyProgress&)>;
    using FileCallback = std::function<void(const model::FileRecord&)>;
    using ResultCallback = std::function<void(const model::CopyResult&)>;
    using ErrorCallback = std::function<void(const model::ErrorRecord&)>;

    CopyManager(std::filesystem::path source, std::filesystem::path target,
                const backend::Config& config);

    void set_on_scan_progress(ScanProgressCallback cb) { on_scan_progress_ = std::move(cb); }
    void set_on_copy_progress(CopyProgressCallback cb) { on_copy_progress_ = std::move(cb); }
    void set_on_file(FileCallback cb) { on_file_ = std::move(cb); }
    void set_on_result(ResultCallback cb) { on_result_ = std::move(cb); }
    void set_on_error(ErrorCallback cb) { on_error_ = std::move(cb); }

    // Blocks until both phases are over (or the run was rejected up front)
    CopySummary run();

    // Idempotent, callable from any thread; reaches whichever phase is running
    void cancel() { token_.cancel(); }
    [[nodiscard]] bool is_cancelled() const { return token_.is_cancelled(); }

private:
    [[nodiscard]] bool validate(CopySummary& summary);
    void scan_phase(CopySummary& summary, model::FileList& list);
    void copy_phase(CopySummary& summary, const model::FileList& list);
    void report_error(const model::ErrorRecord& error);

    std::filesystem::path source_;
    std::filesystem::path target_;
    backend::Config config_;
    util::CancellationToken token_;
    std::atomic<size_t> error_count_{0};

    ScanProgressCallback on_scan_progress_;
    CopyProgressCallback on_copy_progress_;
    FileCallback on_file_;
    ResultCallback on_result_;
    ErrorCallback on_error_;
};

}  // namespace rapidcopy::collectors
