#pragma once

#include "change_source.hpp"
#include "multi_root_watcher.hpp"
#include "shutdown_signal.hpp"
#include "template_store.hpp"
#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>

namespace lifecore {

// Drives template reloads from the merged change stream, one batch at a time.
// A failed reload is logged and the loop goes on; a failed stream ends it.
class reload_coordinator : public std::enable_shared_from_this<reload_coordinator> {
public:
    struct stats {
        uint64_t batches = 0;
        uint64_t reloads = 0;
        uint64_t reload_failures = 0;
    };

    reload_coordinator(template_provider& provider,
                       shutdown_signal& shutdown,
                       std::shared_ptr<spdlog::logger> log);

    // Consume `watcher` until its stream ends or fails, or shutdown is
    // raised. A raise while waiting for the next batch ends the wait.
    // Never throws.
    asio::awaitable<void> run(std::unique_ptr<multi_root_watcher> watcher);

    // Run detached on `executor`. Keeps this coordinator alive until the loop exits.
    void spawn(asio::any_io_executor executor, std::unique_ptr<multi_root_watcher> watcher);

    template_provider& provider() const { return m_provider; }
    bool running() const { return m_running.load(std::memory_order_acquire); }
    stats get_stats() const;

private:
    asio::awaitable<void> consume(multi_root_watcher& watcher);

    template_provider& m_provider;
    shutdown_signal& m_shutdown;
    std::shared_ptr<spdlog::logger> m_log;

    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_batches{0};
    std::atomic<uint64_t> m_reloads{0};
    std::atomic<uint64_t> m_reload_failures{0};
};

// Subscribe to every root of `coordinator`'s provider and start the reload
// loop in the background. Throws setup_error if any root cannot be watched;
// nothing is started in that case.
asio::awaitable<void> watch_templates(change_source& source,
                                      std::shared_ptr<reload_coordinator> coordinator,
                                      std::shared_ptr<spdlog::logger> log);

} // namespace lifecore
