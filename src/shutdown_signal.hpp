#pragma once

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace lifecore {

// Process-wide shutdown event. Raised at most once; every listener hears it
// exactly once, including listeners registered after the fact.
class shutdown_signal {
public:
    shutdown_signal() = default;
    shutdown_signal(const shutdown_signal&) = delete;
    shutdown_signal& operator=(const shutdown_signal&) = delete;

    // Returns true only for the call that actually raised it.
    bool raise();

    bool raised() const { return m_raised.load(std::memory_order_acquire); }

    // Runs `fn` once: on the raising thread, or right away if already raised.
    void on_raise(std::function<void()> fn);

    // Completes on the caller's executor once the signal is raised.
    asio::awaitable<void> wait();

private:
    std::mutex m_mutex;
    std::atomic<bool> m_raised{false};
    std::vector<std::function<void()>> m_listeners;
};

// Turns SIGINT/SIGTERM into a raise() of the shutdown_signal.
// Must outlive the io_context run loop.
class shutdown_coordinator {
public:
    // Throws signal_install_error if the listeners cannot be installed.
    shutdown_coordinator(asio::io_context& ioc,
                         shutdown_signal& signal,
                         std::shared_ptr<spdlog::logger> log);

private:
    void on_signal(const asio::error_code& ec, int signal_number);

    asio::signal_set m_signals;
    shutdown_signal& m_signal;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace lifecore
