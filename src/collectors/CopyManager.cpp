#include "collectors/CopyManager.hpp"
#include "backend/CopyEngine.hpp"
#include "backend/TreeScanner.hpp"
#include "collectors/FileListCollector.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <exception>
#include <thread>

namespace rapidcopy::collectors {

using util::Logger;

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Completed:           return "completed";
        case RunStatus::CompletedWithErrors: return "completed with errors";
        case RunStatus::Canceled:            return "canceled";
        case RunStatus::Failed:              return "failed";
    }
    return "unknown";
}

CopyManager::CopyManager(std::filesystem::path source, std::filesystem::path target,
                         const backend::Config& config)
    : source_(std::move(source)), target_(std::move(target)), config_(config) {}

CopySummary CopyManager::run() {
    Logger::info("CopyManager: " + source_.string() + " -> " + target_.string());

    CopySummary summary;
    error_count_ = 0;

    if (!validate(summary)) {
        summary.status = RunStatus::Failed;
        summary.error_count = error_count_.load();
        Logger::error("CopyManager: Rejected: " + summary.failure_reason);
        return summary;
    }

    model::FileList list;
    scan_phase(summary, list);

    if (token_.is_cancelled()) {
        summary.status = RunStatus::Canceled;
        summary.error_count = error_count_.load();
        Logger::info("CopyManager: Cancelled during scan");
        return summary;
    }

    copy_phase(summary, list);

    summary.error_count = error_count_.load();
    if (token_.is_cancelled()) {
        summary.status = RunStatus::Canceled;
    } else if (summary.last_copy.failed_files > 0 || summary.error_count > 0) {
        summary.status = RunStatus::CompletedWithErrors;
    } else {
        summary.status = RunStatus::Completed;
    }

    Logger::info(std::string("CopyManager: Run ") + to_string(summary.status) + " (" +
                 std::to_string(summary.last_copy.completed_files) + "/" +
                 std::to_string(summary.last_copy.total_files) + " files, " +
                 std::to_string(summary.error_count) + " errors)");
    return summary;
}

bool CopyManager::validate(CopySummary& summary) {
    std::error_code ec;
    if (!std::filesystem::is_directory(source_, ec)) {
        if (!ec) ec = std::make_error_code(std::errc::not_a_directory);
        summary.failure_reason = "source is not a directory: " + source_.string();
        report_error({model::ErrorRecord::Phase::Scan, source_, ec, "source is not a directory"});
        return false;
    }

    // Copying into our own subtree would rescan what we write
    if (util::Platform::is_within(target_, source_)) {
        summary.failure_reason = "target " + target_.string() + " is inside source " + source_.string();
        report_error({model::ErrorRecord::Phase::Prepare, target_,
                      std::make_error_code(std::errc::invalid_argument), "target is inside source"});
        return false;
    }
    return true;
}

void CopyManager::scan_phase(CopySummary& summary, model::FileList& list) {
    backend::TreeScanner scanner(config_.scan, token_);
    scanner.start(source_);

    {
        std::jthread progress_drain([&]() {
            while (auto progress = scanner.progress().pop()) {
                summary.last_scan = *progress;
                if (on_scan_progress_) on_scan_progress_(*progress);
            }
        });
        std::jthread error_drain([&]() {
            while (auto error = scanner.errors().pop()) {
                report_error(*error);
            }
        });

        FileListCollector collector(config_.scan.collect_sizes);
        if (on_file_) collector.set_on_record(on_file_);
        try {
            list = collector.collect(scanner.files());
        } catch (const std::exception& e) {
            // Workers block on a full file stream; unblock them before unwinding
            Logger::error(std::string("CopyManager: File callback failed, cancelling: ") + e.what());
            token_.cancel();
            while (scanner.files().pop()) {}
            throw;
        }

        scanner.wait();
    }

    summary.files_found = list.total_files;
    summary.bytes_found = list.total_bytes;
}

void CopyManager::copy_phase(CopySummary& summary, const model::FileList& list) {
    backend::CopyEngine engine(source_, target_, config_.copy, token_);
    engine.start(list);

    {
        std::jthread progress_drain([&]() {
            while (auto progress = engine.progress().pop()) {
                summary.last_copy = *progress;
                if (on_copy_progress_) on_copy_progress_(*progress);
            }
        });
        std::jthread error_drain([&]() {
            while (auto error = engine.errors().pop()) {
                report_error(*error);
            }
        });

        try {
            while (auto result = engine.results().pop()) {
                if (on_result_) on_result_(*result);
            }
        } catch (const std::exception& e) {
            Logger::error(std::string("CopyManager: Result callback failed, cancelling: ") + e.what());
            token_.cancel();
            while (engine.results().pop()) {}
            throw;
        }

        engine.wait();
    }
}

void CopyManager::report_error(const model::ErrorRecord& error) {
    error_count_.fetch_add(1);
    Logger::warn("CopyManager: " + error.describe());
    if (on_error_) on_error_(error);
}

}  // namespace rapidcopy::collectors
