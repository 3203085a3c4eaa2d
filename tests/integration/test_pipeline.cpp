#include "../framework/SimpleTest.hpp"
#include "../framework/TempTree.hpp"
#include "backend/Config.hpp"
#include "collectors/CopyManager.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace rapidcopy;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

backend::Config test_config() {
    auto cfg = backend::ConfigLoader::create_default_config();
    cfg.scan.workers = 4;
    cfg.scan.tick_interval = 10ms;
    cfg.copy.workers = 4;
    cfg.copy.buffer_size = 8192;
    cfg.copy.tick_interval = 100ms;
    return cfg;
}

}  // namespace

TEST_CASE(test_pipeline_mirrors_tree) {
    test::TempTree src;
    test::TempTree dst;
    src.write("x.txt", "abc");
    src.write("sub/y.txt", "");
    src.mkdir("sub/empty");

    collectors::CopyManager manager(src.root(), dst.root() / "mirror", test_config());

    std::mutex mutex;
    std::vector<model::CopyResult> results;
    std::atomic<int> files_seen{0};
    manager.set_on_file([&files_seen](const model::FileRecord&) { files_seen++; });
    manager.set_on_result([&](const model::CopyResult& r) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(r);
    });

    auto summary = manager.run();

    ASSERT_TRUE(summary.status == collectors::RunStatus::Completed);
    ASSERT_EQ(summary.files_found, 2u);
    ASSERT_EQ(files_seen.load(), 2);
    ASSERT_EQ(results.size(), 2u);
    ASSERT_EQ(summary.error_count, 0u);

    auto mirror = dst.root() / "mirror";
    ASSERT_EQ(test::read_file(mirror / "x.txt"), "abc");
    ASSERT_TRUE(fs::is_regular_file(mirror / "sub" / "y.txt"));
    ASSERT_EQ(fs::file_size(mirror / "sub" / "y.txt"), 0u);
    ASSERT_TRUE(fs::is_directory(mirror / "sub" / "empty"));

    ASSERT_EQ(summary.last_copy.completed_files, 2u);
    ASSERT_EQ(summary.last_copy.completed_bytes, 3u);
    ASSERT_EQ(summary.last_copy.total_bytes, 3u);
}

TEST_CASE(test_pipeline_with_sizes_and_verification) {
    test::TempTree src;
    test::TempTree dst;
    for (int i = 0; i < 50; ++i) {
        src.write("d" + std::to_string(i % 5) + "/f" + std::to_string(i),
                  test::pattern_content(10000 + static_cast<size_t>(i), static_cast<unsigned>(i)));
    }

    auto cfg = test_config();
    cfg.scan.collect_sizes = true;
    cfg.copy.verify = true;

    collectors::CopyManager manager(src.root(), dst.root(), cfg);
    auto summary = manager.run();

    ASSERT_TRUE(summary.status == collectors::RunStatus::Completed);
    ASSERT_EQ(summary.files_found, 50u);
    ASSERT_EQ(summary.bytes_found, summary.last_copy.completed_bytes);
    ASSERT_EQ(summary.last_scan.total_files, 50u);
    ASSERT_EQ(test::read_file(dst.root() / "d3" / "f13"), test::read_file(src.root() / "d3" / "f13"));
}

TEST_CASE(test_pipeline_empty_source) {
    test::TempTree src;
    test::TempTree dst;
    src.mkdir("only/dirs/here");

    collectors::CopyManager manager(src.root(), dst.root(), test_config());
    auto summary = manager.run();

    ASSERT_TRUE(summary.status == collectors::RunStatus::Completed);
    ASSERT_EQ(summary.files_found, 0u);
    ASSERT_TRUE(fs::is_directory(dst.root() / "only" / "dirs" / "here"));
}

TEST_CASE(test_pipeline_missing_source_fails) {
    test::TempTree dst;
    std::vector<model::ErrorRecord> errors;

    collectors::CopyManager manager("/nonexistent/rapidcopy/source", dst.root(), test_config());
    manager.set_on_error([&errors](const model::ErrorRecord& e) { errors.push_back(e); });
    auto summary = manager.run();

    ASSERT_TRUE(summary.status == collectors::RunStatus::Failed);
    ASSERT_FALSE(summary.failure_reason.empty());
    ASSERT_EQ(errors.size(), 1u);
    ASSERT_TRUE(fs::is_empty(dst.root()));
}

TEST_CASE(test_pipeline_target_inside_source_fails) {
    test::TempTree src;
    src.write("a.txt", "a");

    collectors::CopyManager manager(src.root(), src.root() / "backup", test_config());
    auto summary = manager.run();

    ASSERT_TRUE(summary.status == collectors::RunStatus::Failed);
    ASSERT_FALSE(fs::exists(src.root() / "backup"));
}

TEST_CASE(test_pipeline_cancel_before_run) {
    test::TempTree src;
    test::TempTree dst;
    src.write("a.txt", "a");

    collectors::CopyManager manager(src.root(), dst.root() / "out", test_config());
    manager.cancel();
    auto summary = manager.run();

    ASSERT_TRUE(summary.status == collectors::RunStatus::Canceled);
    ASSERT_EQ(summary.files_found, 0u);
    ASSERT_FALSE(fs::exists(dst.root() / "out" / "a.txt"));
}

TEST_CASE(test_pipeline_cancel_during_copy) {
    test::TempTree src;
    test::TempTree dst;
    for (int i = 0; i < 200; ++i) {
        src.write("f" + std::to_string(i), test::pattern_content(32 * 1024, static_cast<unsigned>(i)));
    }

    auto cfg = test_config();
    cfg.copy.workers = 1;
    cfg.copy.buffer_size = 512;
    cfg.copy.result_queue_depth = 1;

    collectors::CopyManager manager(src.root(), dst.root(), cfg);
    std::atomic<int> copied{0};
    manager.set_on_result([&](const model::CopyResult& r) {
        // Cancel once the copy phase is clearly underway
        if (r.success() && ++copied == 5) manager.cancel();
    });
    auto summary = manager.run();

    ASSERT_TRUE(summary.status == collectors::RunStatus::Canceled);
    const auto& last = summary.last_copy;
    ASSERT_EQ(last.completed_files + last.failed_files + last.skipped_files, 200u);
    ASSERT_TRUE(last.completed_files < 200u);
}

TEST_CASE(test_pipeline_throwing_file_callback_cancels) {
    test::TempTree src;
    test::TempTree dst;
    for (int i = 0; i < 100; ++i) {
        src.write("d" + std::to_string(i % 4) + "/f" + std::to_string(i), "x");
    }

    auto cfg = test_config();
    cfg.scan.file_queue_depth = 1;

    collectors::CopyManager manager(src.root(), dst.root() / "out", cfg);
    manager.set_on_file([](const model::FileRecord&) {
        throw std::runtime_error("listener failed");
    });

    ASSERT_THROWS(manager.run(), std::runtime_error);
    ASSERT_TRUE(manager.is_cancelled());
    ASSERT_FALSE(fs::exists(dst.root() / "out"));
}

TEST_CASE(test_pipeline_throwing_result_callback_cancels) {
    test::TempTree src;
    test::TempTree dst;
    for (int i = 0; i < 100; ++i) {
        src.write("f" + std::to_string(i), "payload");
    }

    auto cfg = test_config();
    cfg.copy.result_queue_depth = 1;

    collectors::CopyManager manager(src.root(), dst.root(), cfg);
    int calls = 0;
    manager.set_on_result([&calls](const model::CopyResult&) {
        if (++calls == 3) throw std::runtime_error("listener failed");
    });

    ASSERT_THROWS(manager.run(), std::runtime_error);
    ASSERT_TRUE(manager.is_cancelled());
    ASSERT_EQ(calls, 3);
}

int main() {
    rapidcopy::util::Logger::init("/tmp/rapidcopy_test_pipeline.log");
    return rapidcopy::test::TestRunner::instance().run_all();
}
