#include "../framework/SimpleTest.hpp"
#include "../framework/TempTree.hpp"
#include "backend/Config.hpp"
#include "events/Ticker.hpp"
#include "ui/Formatting.hpp"
#include "util/BoundedQueue.hpp"
#include "util/CancellationToken.hpp"
#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/WaitGroup.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace rapidcopy;
using namespace std::chrono_literals;

// ---------------------------------------------------------------- BoundedQueue

TEST_CASE(test_queue_fifo_and_close_drains) {
    util::BoundedQueue<int> q(4);
    ASSERT_TRUE(q.push(1));
    ASSERT_TRUE(q.push(2));
    q.close();

    // Closing keeps queued values poppable
    ASSERT_EQ(q.pop().value(), 1);
    ASSERT_EQ(q.pop().value(), 2);
    ASSERT_FALSE(q.pop().has_value());
    ASSERT_FALSE(q.push(3));
}

TEST_CASE(test_queue_try_push_drops_when_full) {
    util::BoundedQueue<int> q(2);
    ASSERT_TRUE(q.try_push(1));
    ASSERT_TRUE(q.try_push(2));
    ASSERT_FALSE(q.try_push(3));
    ASSERT_EQ(q.size(), 2u);
}

TEST_CASE(test_queue_push_latest_keeps_newest) {
    util::BoundedQueue<int> q(2);
    ASSERT_TRUE(q.push_latest(1));
    ASSERT_TRUE(q.push_latest(2));
    ASSERT_TRUE(q.push_latest(3));
    q.close();

    ASSERT_EQ(q.pop().value(), 2);
    ASSERT_EQ(q.pop().value(), 3);
    ASSERT_FALSE(q.pop().has_value());
}

TEST_CASE(test_queue_blocking_push_resumes_after_pop) {
    util::BoundedQueue<int> q(1);
    ASSERT_TRUE(q.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        q.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    ASSERT_FALSE(pushed.load());

    ASSERT_EQ(q.pop().value(), 1);
    producer.join();
    ASSERT_TRUE(pushed.load());
    ASSERT_EQ(q.pop().value(), 2);
}

TEST_CASE(test_queue_close_wakes_blocked_consumer) {
    util::BoundedQueue<int> q(1);
    std::atomic<bool> ended{false};
    std::thread consumer([&]() {
        while (q.pop()) {}
        ended = true;
    });

    std::this_thread::sleep_for(20ms);
    q.close();
    consumer.join();
    ASSERT_TRUE(ended.load());
}

TEST_CASE(test_queue_rejects_zero_capacity) {
    ASSERT_THROWS(util::BoundedQueue<int>(0), std::invalid_argument);
}

TEST_CASE(test_queue_many_producers_no_loss) {
    util::BoundedQueue<int> q(8);
    constexpr int producers = 4;
    constexpr int per_producer = 500;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&q]() {
            for (int i = 0; i < per_producer; ++i) q.push(1);
        });
    }

    long long sum = 0;
    std::thread consumer([&]() {
        while (auto v = q.pop()) sum += *v;
    });

    for (auto& t : threads) t.join();
    q.close();
    consumer.join();

    ASSERT_EQ(sum, producers * per_producer);
}

// ---------------------------------------------------------------- WaitGroup

TEST_CASE(test_wait_group_releases_at_zero) {
    util::WaitGroup wg;
    wg.add(3);

    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&wg]() {
            std::this_thread::sleep_for(10ms);
            wg.done();
        });
    }

    wg.wait();
    ASSERT_EQ(wg.count(), 0);
    for (auto& t : threads) t.join();
}

TEST_CASE(test_wait_group_negative_is_logic_error) {
    util::WaitGroup wg;
    ASSERT_THROWS(wg.done(), std::logic_error);
}

// ---------------------------------------------------------------- CancellationToken

TEST_CASE(test_cancellation_shared_between_copies) {
    util::CancellationToken token;
    auto copy = token;
    ASSERT_FALSE(copy.is_cancelled());

    ASSERT_TRUE(token.cancel());
    ASSERT_FALSE(token.cancel());  // Idempotent
    ASSERT_TRUE(copy.is_cancelled());
    ASSERT_TRUE(copy.token().stop_requested());
}

// ---------------------------------------------------------------- Ticker

TEST_CASE(test_ticker_runs_and_stops) {
    std::atomic<int> ticks{0};
    events::Ticker ticker("test", 10ms, [&ticks]() { ticks++; });
    ticker.start();
    std::this_thread::sleep_for(80ms);
    ticker.stop();

    int after_stop = ticks.load();
    ASSERT_TRUE(after_stop >= 2);

    std::this_thread::sleep_for(40ms);
    ASSERT_EQ(ticks.load(), after_stop);
}

TEST_CASE(test_ticker_stop_is_prompt) {
    events::Ticker ticker("slow", 10s, []() {});
    ticker.start();

    auto begin = std::chrono::steady_clock::now();
    ticker.stop();
    ASSERT_TRUE(std::chrono::steady_clock::now() - begin < 1s);
}

// ---------------------------------------------------------------- Formatting

TEST_CASE(test_format_bytes) {
    ASSERT_EQ(ui::format_bytes(0), "0 B");
    ASSERT_EQ(ui::format_bytes(512), "512 B");
    ASSERT_EQ(ui::format_bytes(1536), "1.5 KiB");
    ASSERT_EQ(ui::format_bytes(3ull * 1024 * 1024), "3.0 MiB");
}

TEST_CASE(test_format_duration) {
    ASSERT_EQ(ui::format_duration(45s), "45s");
    ASSERT_EQ(ui::format_duration(187s), "3m 07s");
    ASSERT_EQ(ui::format_duration(3723s), "1h 02m 03s");
}

TEST_CASE(test_trunc_helpers) {
    ASSERT_EQ(ui::trunc_pad("abcdef", 4), "abc…");
    ASSERT_EQ(ui::trunc_pad("ab", 4), "ab  ");
    ASSERT_EQ(ui::trunc_left("/a/b/c.txt", 6), "…c.txt");
    ASSERT_EQ(ui::display_cols("\x1B[31mred\x1B[0m"), 3);
    ASSERT_EQ(ui::progress_bar(0.5, 10), "[#####-----]");
}

TEST_CASE(test_copy_status_line_fits_width) {
    model::CopyProgress p;
    p.total_files = 10;
    p.completed_files = 4;
    p.current_file = "/some/very/long/path/that/will/not/fit/into/the/line/file.bin";
    auto line = ui::copy_status_line(p, 60);
    ASSERT_EQ(ui::display_cols(line), 60);
}

// ---------------------------------------------------------------- Config

TEST_CASE(test_config_load_from_file) {
    test::TempTree tree;
    auto path = tree.write("config.toml",
        "# comment\n"
        "[scan]\n"
        "workers = 3\n"
        "collect_sizes = true\n"
        "tick_ms = 5   # clamped to 10\n"
        "[copy]\n"
        "workers = 2\n"
        "buffer_size_mb = 4\n"
        "verify = yes\n"
        "[log]\n"
        "level = \"debug\"\n");

    auto cfg = backend::ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.scan.workers, 3);
    ASSERT_TRUE(cfg.scan.collect_sizes);
    ASSERT_EQ(cfg.scan.tick_interval, backend::Config::MIN_SCAN_TICK);
    ASSERT_EQ(cfg.copy.workers, 2);
    ASSERT_EQ(cfg.copy.buffer_size, 4u * 1024 * 1024);
    ASSERT_TRUE(cfg.copy.verify);
    ASSERT_EQ(cfg.log_level, "debug");
}

TEST_CASE(test_config_invalid_values_keep_defaults) {
    test::TempTree tree;
    auto path = tree.write("config.toml",
        "[scan]\n"
        "workers = lots\n"
        "collect_sizes = maybe\n");

    auto defaults = backend::ConfigLoader::create_default_config();
    auto cfg = backend::ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.scan.workers, defaults.scan.workers);
    ASSERT_FALSE(cfg.scan.collect_sizes);
}

TEST_CASE(test_config_env_overrides) {
    setenv("SCANNER_CONCURRENCY", "5", 1);
    setenv("SCANNER_COLLECT_SIZE", "1", 1);
    setenv("COPIER_BUFFER_MB", "2", 1);

    auto cfg = backend::ConfigLoader::create_default_config();
    backend::ConfigLoader::apply_env_overrides(cfg);

    unsetenv("SCANNER_CONCURRENCY");
    unsetenv("SCANNER_COLLECT_SIZE");
    unsetenv("COPIER_BUFFER_MB");

    ASSERT_EQ(cfg.scan.workers, 5);
    ASSERT_TRUE(cfg.scan.collect_sizes);
    ASSERT_EQ(cfg.copy.buffer_size, 2u * 1024 * 1024);
}

TEST_CASE(test_config_save_and_reload) {
    test::TempTree tree;
    auto cfg = backend::ConfigLoader::create_default_config();
    cfg.scan.workers = 11;
    cfg.copy.remove_partial = true;
    cfg.log_file = tree.root() / "run.log";

    auto path = tree.root() / "nested" / "config.toml";
    ASSERT_TRUE(backend::ConfigLoader::save_config(cfg, path));

    auto loaded = backend::ConfigLoader::load_from_file(path);
    ASSERT_EQ(loaded.scan.workers, 11);
    ASSERT_TRUE(loaded.copy.remove_partial);
    ASSERT_EQ(loaded.log_file, cfg.log_file);
    ASSERT_EQ(loaded.copy.buffer_size, cfg.copy.buffer_size);
}

TEST_CASE(test_config_caps_oversized_values) {
    test::TempTree tree;
    auto path = tree.write("config.toml",
        "[scan]\n"
        "workers = 100000\n"
        "[copy]\n"
        "workers = 5000\n"
        "buffer_size_mb = 100000000\n");

    auto cfg = backend::ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.scan.workers, backend::Config::MAX_WORKERS);
    ASSERT_EQ(cfg.copy.workers, backend::Config::MAX_WORKERS);
    ASSERT_EQ(cfg.copy.buffer_size, backend::Config::MAX_BUFFER_SIZE);
}

TEST_CASE(test_config_env_buffer_capped) {
    setenv("COPIER_BUFFER_MB", "100000000", 1);
    auto cfg = backend::ConfigLoader::create_default_config();
    backend::ConfigLoader::apply_env_overrides(cfg);
    unsetenv("COPIER_BUFFER_MB");

    ASSERT_EQ(cfg.copy.buffer_size, backend::Config::MAX_BUFFER_SIZE);
}

TEST_CASE(test_config_int_overflow_keeps_value) {
    setenv("SCANNER_CONCURRENCY", "4294967296", 1);
    setenv("COPIER_CONCURRENCY", "-4294967296", 1);
    auto cfg = backend::ConfigLoader::create_default_config();
    cfg.scan.workers = 7;
    cfg.copy.workers = 3;
    backend::ConfigLoader::apply_env_overrides(cfg);
    unsetenv("SCANNER_CONCURRENCY");
    unsetenv("COPIER_CONCURRENCY");

    ASSERT_EQ(cfg.scan.workers, 7);
    ASSERT_EQ(cfg.copy.workers, 3);
}

TEST_CASE(test_default_worker_counts) {
    ASSERT_TRUE(util::Platform::default_scan_workers() >= 8);
    int copy_workers = util::Platform::default_copy_workers();
    ASSERT_TRUE(copy_workers >= 4 && copy_workers <= 16);
}

TEST_CASE(test_platform_is_within) {
    ASSERT_TRUE(util::Platform::is_within("/data/src/sub", "/data/src"));
    ASSERT_TRUE(util::Platform::is_within("/data/src", "/data/src/"));
    ASSERT_FALSE(util::Platform::is_within("/data/srcx", "/data/src"));
    ASSERT_FALSE(util::Platform::is_within("/data/dst", "/data/src"));
}

// ---------------------------------------------------------------- Logger / Hasher

TEST_CASE(test_logger_parse_level) {
    util::Logger::Level level = util::Logger::Level::Info;
    ASSERT_TRUE(util::Logger::parse_level("WARNING", level));
    ASSERT_TRUE(level == util::Logger::Level::Warn);
    ASSERT_TRUE(util::Logger::parse_level("debug", level));
    ASSERT_TRUE(level == util::Logger::Level::Debug);
    ASSERT_FALSE(util::Logger::parse_level("loud", level));
}

TEST_CASE(test_sha256_known_vectors) {
    test::TempTree tree;
    auto abc = tree.write("abc.txt", "abc");
    auto empty = tree.write("empty.bin", "");
    std::vector<char> buffer(2);  // Forces several chunks for "abc"
    util::CancellationToken token;
    util::ContentHasher::Digest digest{};

    ASSERT_FALSE(util::ContentHasher::sha256_file(abc.string(), buffer, token, digest));
    ASSERT_EQ(util::ContentHasher::to_hex(digest),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    ASSERT_FALSE(util::ContentHasher::sha256_file(empty.string(), buffer, token, digest));
    ASSERT_EQ(util::ContentHasher::to_hex(digest),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE(test_sha256_file_missing) {
    std::vector<char> buffer(16);
    util::CancellationToken token;
    util::ContentHasher::Digest digest{};
    auto ec = util::ContentHasher::sha256_file("/nonexistent/rapidcopy/file", buffer, token, digest);
    ASSERT_TRUE(ec == std::errc::no_such_file_or_directory);
}

TEST_CASE(test_sha256_file_cancelled) {
    test::TempTree tree;
    auto file = tree.write("data.bin", test::pattern_content(4096));
    std::vector<char> buffer(64);
    util::CancellationToken token;
    token.cancel();
    util::ContentHasher::Digest digest{};
    auto ec = util::ContentHasher::sha256_file(file.string(), buffer, token, digest);
    ASSERT_TRUE(ec == std::errc::operation_canceled);
}

int main() {
    rapidcopy::util::Logger::init("/tmp/rapidcopy_test_utils.log");
    return rapidcopy::test::TestRunner::instance().run_all();
}
