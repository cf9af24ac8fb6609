#include "reload_coordinator.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include "template_store.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

using lifecore::multi_root_watcher;
using lifecore::reload_coordinator;
using test_support::failure;
using test_support::files;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Counts reloads; fails the calls listed in `failing` (1-based).
class counting_provider : public lifecore::template_provider {
public:
    explicit counting_provider(std::vector<std::string> roots) : m_roots(std::move(roots)) {}

    std::vector<std::string> watch_roots() const override { return m_roots; }

    void reload() override {
        ++calls;
        if (failing.count(calls)) {
            throw lifecore::reload_error("syntax error in layout.html");
        }
    }

    int calls = 0;
    std::set<int> failing;

private:
    std::vector<std::string> m_roots;
};

asio::awaitable<void> run_loop(test_support::fake_change_source& source,
                               std::shared_ptr<reload_coordinator> coordinator) {
    auto watcher = co_await multi_root_watcher::open(source, coordinator->provider().watch_roots(), make_log());
    co_await coordinator->run(std::move(watcher));
}

} // namespace

TEST(reload_coordinator, one_reload_per_batch) {
    asio::io_context ioc;
    test_support::fake_change_source source;
    source.scripts["/a"] = {files({"x.html"}), files({"y.html"})};
    source.scripts["/b"] = {files({"z.html"})};

    counting_provider provider(std::vector<std::string>{"/a", "/b"});
    lifecore::shutdown_signal shutdown;
    auto coordinator = std::make_shared<reload_coordinator>(provider, shutdown, make_log());

    test_support::run(ioc, run_loop(source, coordinator));

    EXPECT_EQ(provider.calls, 3);
    auto stats = coordinator->get_stats();
    EXPECT_EQ(stats.batches, 3u);
    EXPECT_EQ(stats.reloads, 3u);
    EXPECT_EQ(stats.reload_failures, 0u);
    EXPECT_FALSE(coordinator->running());
}

TEST(reload_coordinator, failed_reload_does_not_stop_the_loop) {
    asio::io_context ioc;
    test_support::fake_change_source source;
    source.scripts["/a"] = {files({"layout.html"}), files({"layout.html"}), files({"layout.html"})};

    counting_provider provider(std::vector<std::string>{"/a"});
    provider.failing = {2};
    lifecore::shutdown_signal shutdown;
    auto coordinator = std::make_shared<reload_coordinator>(provider, shutdown, make_log());

    test_support::run(ioc, run_loop(source, coordinator));

    EXPECT_EQ(provider.calls, 3);
    auto stats = coordinator->get_stats();
    EXPECT_EQ(stats.reloads, 2u);
    EXPECT_EQ(stats.reload_failures, 1u);
}

TEST(reload_coordinator, stream_failure_ends_the_loop) {
    asio::io_context ioc;
    test_support::fake_change_source source;
    source.scripts["/a"] = {files({"a.html"}), failure("watch service went away")};
    // Without the failure this loop would never end
    source.endless.insert("/b");

    counting_provider provider(std::vector<std::string>{"/a", "/b"});
    lifecore::shutdown_signal shutdown;
    auto coordinator = std::make_shared<reload_coordinator>(provider, shutdown, make_log());

    test_support::run(ioc, run_loop(source, coordinator));

    EXPECT_FALSE(coordinator->running());
    auto stats = coordinator->get_stats();
    EXPECT_EQ(stats.batches, stats.reloads);
    EXPECT_GE(stats.reloads, 1u);
    EXPECT_EQ(*source.live, 0);
}

TEST(reload_coordinator, shutdown_stops_reloading) {
    asio::io_context ioc;
    test_support::fake_change_source source;
    source.endless.insert("/a");

    counting_provider provider(std::vector<std::string>{"/a"});
    lifecore::shutdown_signal shutdown;
    shutdown.raise();
    auto coordinator = std::make_shared<reload_coordinator>(provider, shutdown, make_log());

    test_support::run(ioc, run_loop(source, coordinator));

    EXPECT_EQ(provider.calls, 0);
    EXPECT_FALSE(coordinator->running());
}

TEST(reload_coordinator, shutdown_ends_wait_on_idle_roots) {
    using namespace std::chrono_literals;

    asio::io_context ioc;
    test_support::fake_change_source source;
    source.silent.insert("/a");
    source.silent_for = 500ms;

    counting_provider provider(std::vector<std::string>{"/a"});
    lifecore::shutdown_signal shutdown;
    auto coordinator = std::make_shared<reload_coordinator>(provider, shutdown, make_log());

    bool running_before = false;
    bool running_after = true;
    auto elapsed = std::chrono::steady_clock::duration::max();

    auto scenario = [&]() -> asio::awaitable<void> {
        auto watcher = co_await multi_root_watcher::open(source, provider.watch_roots(), make_log());
        coordinator->spawn(co_await asio::this_coro::executor, std::move(watcher));

        asio::steady_timer timer(co_await asio::this_coro::executor);
        timer.expires_after(20ms);
        co_await timer.async_wait(asio::use_awaitable);
        running_before = coordinator->running();

        auto raised_at = std::chrono::steady_clock::now();
        shutdown.raise();
        // Well short of the silent root's next report
        timer.expires_after(50ms);
        co_await timer.async_wait(asio::use_awaitable);
        running_after = coordinator->running();
        elapsed = std::chrono::steady_clock::now() - raised_at;
    };

    test_support::run(ioc, scenario());

    EXPECT_TRUE(running_before);
    EXPECT_FALSE(running_after);
    EXPECT_LT(elapsed, 500ms);
    EXPECT_EQ(provider.calls, 0);
    EXPECT_EQ(coordinator->get_stats().batches, 0u);
}

TEST(reload_coordinator, watch_templates_runs_in_background) {
    asio::io_context ioc;
    test_support::fake_change_source source;
    source.scripts["/a"] = {files({"one.html"}), files({"two.html"})};

    counting_provider provider(std::vector<std::string>{"/a"});
    lifecore::shutdown_signal shutdown;
    auto coordinator = std::make_shared<reload_coordinator>(provider, shutdown, make_log());

    // Returns once subscribed; the loop itself keeps the io_context busy
    test_support::run(ioc, lifecore::watch_templates(source, coordinator, make_log()));

    EXPECT_EQ(provider.calls, 2);
    EXPECT_FALSE(coordinator->running());
}

TEST(reload_coordinator, watch_templates_setup_failure_starts_nothing) {
    asio::io_context ioc;
    test_support::fake_change_source source;
    source.scripts["/a"] = {files({"one.html"})};
    source.unresolvable.insert("/b");

    counting_provider provider(std::vector<std::string>{"/a", "/b"});
    lifecore::shutdown_signal shutdown;
    auto coordinator = std::make_shared<reload_coordinator>(provider, shutdown, make_log());

    EXPECT_THROW(test_support::run(ioc, lifecore::watch_templates(source, coordinator, make_log())),
                 lifecore::setup_error);
    EXPECT_EQ(provider.calls, 0);
    EXPECT_EQ(coordinator->get_stats().batches, 0u);
    EXPECT_EQ(*source.live, 0);
}

// Two roots both define layout.html; one batch from the second root gives
// exactly one reload, and a snapshot held across it keeps rendering the old text.
TEST(reload_coordinator, change_in_overridden_root_keeps_override) {
    auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    auto base = fs::temp_directory_path() / (std::string("lifecore_reload_") + info->name());
    fs::remove_all(base);
    fs::create_directories(base / "a");
    fs::create_directories(base / "b");

    auto write = [](const fs::path& p, const std::string& content) {
        std::ofstream out(p, std::ios::trunc);
        out << content;
    };
    write(base / "a" / "layout.html", "A1");
    write(base / "b" / "layout.html", "B1");

    lifecore::templates_config cfg;
    cfg.paths = {(base / "a").string(), (base / "b").string()};
    lifecore::template_store store(cfg, make_log());
    auto in_progress = store.snapshot();
    ASSERT_EQ(in_progress->render("layout.html", {}), "B1");

    write(base / "a" / "layout.html", "A2");
    write(base / "b" / "layout.html", "B2");

    asio::io_context ioc;
    test_support::fake_change_source source;
    source.scripts[cfg.paths[1]] = {files({"layout.html"})};

    lifecore::shutdown_signal shutdown;
    auto coordinator = std::make_shared<reload_coordinator>(store, shutdown, make_log());
    test_support::run(ioc, run_loop(source, coordinator));

    EXPECT_EQ(coordinator->get_stats().reloads, 1u);

    auto snap = store.snapshot();
    EXPECT_EQ(snap->version, 2u);
    EXPECT_EQ(snap->render("layout.html", {}), "B2");

    EXPECT_EQ(in_progress->version, 1u);
    EXPECT_EQ(in_progress->render("layout.html", {}), "B1");

    std::error_code ec;
    fs::remove_all(base, ec);
}
