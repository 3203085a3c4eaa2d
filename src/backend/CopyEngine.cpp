#include "backend/CopyEngine.hpp"
#include "events/Ticker.hpp"
#include "util/ContentHasher.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <new>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace rapidcopy::backend {

using util::Logger;

namespace {

constexpr size_t SINGLE_COPY_BUFFER = 32 * 1024;
constexpr const char* VERIFY_FAILED = "verification failed";

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

// Owns a POSIX descriptor; close() reports the error the destructor would lose
class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) ::close(fd_);
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    std::error_code close() {
        if (fd_ < 0) return {};
        int rc = ::close(fd_);
        fd_ = -1;
        return rc == 0 ? std::error_code() : last_error();
    }

private:
    int fd_;
};

std::error_code write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return {};
}

std::filesystem::path normalized(const std::filesystem::path& p) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(p, ec);
    if (ec) absolute = p;
    return util::DirectoryScanner::normalize_root(absolute.lexically_normal());
}

}  // namespace

CopyEngine::CopyEngine(const std::filesystem::path& source_root,
                       const std::filesystem::path& target_root,
                       const CopyOptions& options,
                       util::CancellationToken token)
    : source_root_(normalized(source_root)),
      target_root_(normalized(target_root)),
      options_(options),
      token_(std::move(token)),
      results_(std::max<size_t>(1, options.result_queue_depth)),
      progress_(std::max<size_t>(1, options.progress_queue_depth)),
      errors_(std::max<size_t>(1, options.error_queue_depth)) {
    options_.workers = std::clamp(options_.workers, 1, Config::MAX_WORKERS);
    if (options_.buffer_size == 0) options_.buffer_size = 1024 * 1024;
    options_.buffer_size = std::min(options_.buffer_size, Config::MAX_BUFFER_SIZE);
}

CopyEngine::~CopyEngine() {
    if (coordinator_.joinable()) {
        token_.cancel();
        results_.close();
        errors_.close();
        progress_.close();
        coordinator_.join();
    }
}

void CopyEngine::set_totals(uint64_t total_files, uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    aggregate_.total_files = total_files;
    aggregate_.total_bytes = total_bytes;
    totals_set_ = true;
}

void CopyEngine::start(const model::FileList& list) {
    std::vector<std::filesystem::path> paths;
    paths.reserve(list.files.size());
    for (const auto& record : list.files) {
        paths.push_back(record.path);
    }
    if (list.sizes_known) {
        set_totals(list.total_files, list.total_bytes);
    }
    start(std::move(paths));
}

void CopyEngine::start(std::vector<std::filesystem::path> files) {
    if (started_) {
        throw std::logic_error("CopyEngine::start called twice");
    }
    started_ = true;

    files_ = std::move(files);
    start_time_ = std::chrono::steady_clock::now();
    coordinator_ = std::thread([this]() { run(); });
}

void CopyEngine::wait() {
    if (coordinator_.joinable()) {
        coordinator_.join();
    }
}

model::CopyProgress CopyEngine::snapshot() const {
    model::CopyProgress progress;
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        progress = aggregate_;
    }

    auto elapsed = std::chrono::steady_clock::now() - start_time_;
    progress.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);

    double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds > 0) {
        progress.files_per_second = static_cast<double>(progress.completed_files) / seconds;
        progress.bytes_per_second = static_cast<double>(progress.completed_bytes) / seconds;
    }

    uint64_t processed = progress.completed_files + progress.failed_files + progress.skipped_files;
    if (progress.files_per_second > 0 && progress.total_files > processed) {
        double remaining_seconds = static_cast<double>(progress.total_files - processed) /
                                   progress.files_per_second;
        progress.estimated_remaining = std::chrono::milliseconds(
            static_cast<int64_t>(remaining_seconds * 1000.0));
    }
    return progress;
}

void CopyEngine::run() {
    Logger::info("CopyEngine: " + source_root_.string() + " -> " + target_root_.string() +
                 ", " + std::to_string(files_.size()) + " files, " +
                 std::to_string(options_.workers) + " workers, " +
                 std::to_string(options_.buffer_size / 1024) + "KB buffers");

    prepare_directories();
    compute_totals();

    events::Ticker ticker("copy", options_.tick_interval, [this]() {
        if (!progress_.try_push(snapshot())) {
            Logger::debug("CopyEngine: Progress tick dropped");
        }
    });
    ticker.start();

    if (!files_.empty()) {
        size_t worker_count = std::min(static_cast<size_t>(options_.workers), files_.size());
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        try {
            for (size_t i = 0; i < worker_count; ++i) {
                workers.emplace_back([this]() { worker_loop(); });
            }
        } catch (const std::system_error& e) {
            // Whatever did start still drains the whole list
            Logger::warn("CopyEngine: Started " + std::to_string(workers.size()) + " of " +
                         std::to_string(worker_count) + " workers: " + e.what());
            if (workers.empty()) {
                emit_error(model::ErrorRecord::Phase::Copy, source_root_, e.code(),
                           "cannot start copy workers");
            }
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    ticker.stop();

    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        size_t attempted = std::min(attempted_.load(), files_.size());
        aggregate_.skipped_files = files_.size() - attempted;
    }

    auto final_progress = snapshot();
    progress_.push_latest(final_progress);

    results_.close();
    errors_.close();
    progress_.close();

    Logger::info("CopyEngine: " + std::string(token_.is_cancelled() ? "Cancelled" : "Finished") +
                 ": " + std::to_string(final_progress.completed_files) + " copied, " +
                 std::to_string(final_progress.failed_files) + " failed, " +
                 std::to_string(final_progress.skipped_files) + " skipped, " +
                 std::to_string(final_progress.completed_bytes) + " bytes in " +
                 std::to_string(final_progress.elapsed.count()) + "ms");
}

void CopyEngine::prepare_directories() {
    std::error_code ec;
    std::filesystem::create_directories(target_root_, ec);
    if (ec) {
        emit_error(model::ErrorRecord::Phase::Prepare, target_root_, ec, "cannot create target root");
    }

    if (!std::filesystem::is_directory(source_root_, ec)) {
        Logger::warn("CopyEngine: Source root is not a directory, skipping skeleton: " + source_root_.string());
        return;
    }

    size_t created = 0;
    util::DirectoryScanner::walk_directories(
        source_root_,
        [this, &created](const std::filesystem::path&, const std::filesystem::path& relative) {
            if (relative == ".") return;
            std::error_code mkdir_ec;
            auto destination = target_root_ / relative;
            std::filesystem::create_directories(destination, mkdir_ec);
            if (mkdir_ec) {
                emit_error(model::ErrorRecord::Phase::Prepare, destination, mkdir_ec,
                           "cannot create directory");
                return;
            }
            ++created;
        },
        [this](const std::filesystem::path& dir, std::error_code list_ec) {
            emit_error(model::ErrorRecord::Phase::Prepare, dir, list_ec, "cannot list directory");
        },
        &token_);

    Logger::info("CopyEngine: Prepared " + std::to_string(created) + " directories");
}

void CopyEngine::compute_totals() {
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        if (totals_set_) {
            if (aggregate_.total_files != files_.size()) {
                Logger::warn("CopyEngine: Total files " + std::to_string(aggregate_.total_files) +
                             " does not match list size " + std::to_string(files_.size()));
                aggregate_.total_files = files_.size();
            }
            return;
        }
    }

    // Sizes weren't collected during the scan; stat once up front
    uint64_t total_bytes = 0;
    for (const auto& file : files_) {
        if (token_.is_cancelled()) break;
        struct stat st;
        if (::stat(file.c_str(), &st) == 0) {
            total_bytes += static_cast<uint64_t>(st.st_size);
        }
    }

    std::lock_guard<std::mutex> lock(progress_mutex_);
    aggregate_.total_files = files_.size();
    aggregate_.total_bytes = total_bytes;
    totals_set_ = true;
}

void CopyEngine::worker_loop() {
    std::vector<char> buffer;
    try {
        buffer.resize(options_.buffer_size);
    } catch (const std::bad_alloc&) {
        // Files this worker would have taken go to the others, or end up skipped
        Logger::error("CopyEngine: Cannot allocate " + std::to_string(options_.buffer_size) +
                      " byte copy buffer, worker exiting");
        emit_error(model::ErrorRecord::Phase::Copy, source_root_,
                   std::make_error_code(std::errc::not_enough_memory), "cannot allocate copy buffer");
        return;
    }

    while (!token_.is_cancelled()) {
        size_t idx = next_index_.fetch_add(1);
        if (idx >= files_.size()) break;
        attempted_.fetch_add(1);

        {
            std::lock_guard<std::mutex> lock(progress_mutex_);
            aggregate_.current_file = files_[idx].string();
        }

        auto result = copy_single_file(files_[idx], buffer);
        record(result);

        if (result.status == model::CopyStatus::Failed) {
            bool verify_failure = result.message == VERIFY_FAILED;
            emit_error(verify_failure ? model::ErrorRecord::Phase::Verify : model::ErrorRecord::Phase::Copy,
                       result.path, result.error, result.message);
        }

        results_.push(std::move(result));
    }
}

model::CopyResult CopyEngine::copy_file(const std::filesystem::path& source) {
    std::vector<char> buffer(SINGLE_COPY_BUFFER);
    return copy_single_file(source, buffer);
}

model::CopyResult CopyEngine::copy_single_file(const std::filesystem::path& source,
                                               std::vector<char>& buffer) {
    model::CopyResult result;
    result.path = source;

    auto fail = [&result](std::error_code ec, std::string message) {
        result.status = model::CopyStatus::Failed;
        result.error = ec;
        result.message = std::move(message);
        return result;
    };

    auto absolute = normalized(source);
    auto relative = absolute.lexically_relative(source_root_);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return fail(std::make_error_code(std::errc::invalid_argument),
                    "path is outside the source root " + source_root_.string());
    }

    auto destination = target_root_ / relative;
    result.destination = destination;

    // Idempotent: concurrent workers racing on the same parent are fine
    std::error_code ec;
    std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec) {
        return fail(ec, "cannot create destination directory");
    }

    struct stat st;
    if (::stat(absolute.c_str(), &st) != 0) {
        return fail(last_error(), "cannot stat source");
    }
    if (S_ISDIR(st.st_mode)) {
        return fail(std::make_error_code(std::errc::is_a_directory), "source is a directory");
    }

    std::string stage;
    uint64_t bytes_copied = 0;
    ec = copy_contents(absolute.string(), destination.string(), buffer, bytes_copied, stage);
    result.bytes_copied = bytes_copied;

    if (!ec && options_.verify) {
        ec = verify_copy(absolute.string(), destination.string(), buffer);
        if (ec && ec != std::errc::operation_canceled) {
            stage = VERIFY_FAILED;
        }
    }

    if (ec) {
        if (options_.remove_partial && ::unlink(destination.c_str()) == 0) {
            Logger::debug("CopyEngine: Removed partial file " + destination.string());
        }
        if (ec == std::errc::operation_canceled) {
            result.status = model::CopyStatus::Canceled;
            result.error = ec;
            result.message = "canceled";
            return result;
        }
        Logger::warn("CopyEngine: " + stage + ": " + absolute.string() + " (" + ec.message() + ")");
        return fail(ec, stage);
    }

    result.status = model::CopyStatus::Copied;
    return result;
}

std::error_code CopyEngine::copy_contents(const std::string& src, const std::string& dst,
                                          std::vector<char>& buffer,
                                          uint64_t& bytes_copied, std::string& stage) {
    FileDescriptor in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in.valid()) {
        stage = "cannot open source";
        return last_error();
    }

    FileDescriptor out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!out.valid()) {
        stage = "cannot create destination";
        return last_error();
    }

#ifdef POSIX_FADV_SEQUENTIAL
    ::posix_fadvise(in.get(), 0, 0, POSIX_FADV_SEQUENTIAL);
#endif

    while (true) {
        if (token_.is_cancelled()) {
            stage = "canceled";
            return std::make_error_code(std::errc::operation_canceled);
        }

        ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            stage = "read failed";
            return last_error();
        }
        if (n == 0) break;

        if (auto ec = write_all(out.get(), buffer.data(), static_cast<size_t>(n))) {
            stage = "write failed";
            return ec;
        }
        bytes_copied += static_cast<uint64_t>(n);
    }

    if (auto ec = out.close()) {
        stage = "cannot close destination";
        return ec;
    }
    return {};
}

std::error_code CopyEngine::verify_copy(const std::string& src, const std::string& dst,
                                        std::vector<char>& buffer) {
    util::ContentHasher::Digest source_digest{};
    util::ContentHasher::Digest target_digest{};

    if (auto ec = util::ContentHasher::sha256_file(src, buffer, token_, source_digest)) return ec;
    if (auto ec = util::ContentHasher::sha256_file(dst, buffer, token_, target_digest)) return ec;

    if (source_digest != target_digest) {
        Logger::warn("CopyEngine: Digest mismatch " + src + " " +
                     util::ContentHasher::to_hex(source_digest) + " != " +
                     util::ContentHasher::to_hex(target_digest));
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

void CopyEngine::record(const model::CopyResult& result) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    if (result.success()) {
        aggregate_.completed_files++;
        aggregate_.completed_bytes += result.bytes_copied;
    } else {
        aggregate_.failed_files++;
    }
}

void CopyEngine::emit_error(model::ErrorRecord::Phase phase, const std::filesystem::path& path,
                            std::error_code ec, std::string message) {
    errors_.push(model::ErrorRecord{phase, path, ec, std::move(message)});
}

}  // namespace rapidcopy::backend
