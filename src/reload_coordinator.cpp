#include "reload_coordinator.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/this_coro.hpp>
#include <spdlog/fmt/ranges.h>

namespace lifecore {

reload_coordinator::reload_coordinator(template_provider& provider,
                                       shutdown_signal& shutdown,
                                       std::shared_ptr<spdlog::logger> log)
    : m_provider(provider), m_shutdown(shutdown), m_log(std::move(log))
{}

asio::awaitable<void> reload_coordinator::run(std::unique_ptr<multi_root_watcher> watcher) {
    using namespace asio::experimental::awaitable_operators;

    m_running.store(true, std::memory_order_release);

    // A raise cancels consume() where it waits for the next batch
    co_await (consume(*watcher) || m_shutdown.wait());

    m_running.store(false, std::memory_order_release);
}

asio::awaitable<void> reload_coordinator::consume(multi_root_watcher& watcher) {
    for (;;) {
        std::optional<change_event_batch> batch;
        bool failed = false;
        std::string failure;

        try {
            batch = co_await watcher.next();
        } catch (const std::exception& e) {
            failed = true;
            failure = e.what();
        }

        if (failed && m_shutdown.raised()) {
            m_log->debug("reload_coordinator: shutting down, stop watching");
            break;
        }

        if (failed) {
            m_log->error("Error while watching templates, stop watching: {}", failure);
            break;
        }

        if (!batch) {
            m_log->info("reload_coordinator: all change streams ended, stop watching");
            break;
        }

        m_batches.fetch_add(1, std::memory_order_relaxed);

        // Nothing reloaded after shutdown begins is observable
        if (m_shutdown.raised()) {
            m_log->debug("reload_coordinator: shutting down, stop watching");
            break;
        }

        m_log->info("Files changed in '{}', reloading templates: {}", batch->root, batch->files);

        try {
            m_provider.reload();
            m_reloads.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            m_reload_failures.fetch_add(1, std::memory_order_relaxed);
            m_log->error("Could not reload templates: {}", e.what());
        }
    }
}

void reload_coordinator::spawn(asio::any_io_executor executor,
                               std::unique_ptr<multi_root_watcher> watcher) {
    asio::co_spawn(executor,
        [self = shared_from_this(), w = std::move(watcher)]() mutable -> asio::awaitable<void> {
            co_await self->run(std::move(w));
        },
        asio::detached
    );
}

reload_coordinator::stats reload_coordinator::get_stats() const {
    return {
        m_batches.load(std::memory_order_relaxed),
        m_reloads.load(std::memory_order_relaxed),
        m_reload_failures.load(std::memory_order_relaxed)
    };
}

asio::awaitable<void> watch_templates(change_source& source,
                                      std::shared_ptr<reload_coordinator> coordinator,
                                      std::shared_ptr<spdlog::logger> log) {
    auto roots = coordinator->provider().watch_roots();

    auto watcher = co_await multi_root_watcher::open(source, roots, log);

    log->info("Watching {} template roots for changes", watcher->root_count());
    coordinator->spawn(co_await asio::this_coro::executor, std::move(watcher));
}

} // namespace lifecore
