#include "shutdown_signal.hpp"
#include "errors.hpp"
#include <asio/as_tuple.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <csignal>

namespace lifecore {

bool shutdown_signal::raise() {
    std::vector<std::function<void()>> listeners;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_raised.load(std::memory_order_relaxed)) return false;
        m_raised.store(true, std::memory_order_release);
        listeners.swap(m_listeners);
    }

    for (auto& fn : listeners) {
        fn();
    }
    return true;
}

void shutdown_signal::on_raise(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_raised.load(std::memory_order_relaxed)) {
            m_listeners.push_back(std::move(fn));
            return;
        }
    }
    fn();
}

asio::awaitable<void> shutdown_signal::wait() {
    using notify_channel = asio::experimental::concurrent_channel<void(asio::error_code)>;

    // Buffered, so a raise that lands before the receive is not lost
    auto ch = std::make_shared<notify_channel>(co_await asio::this_coro::executor, 1);
    on_raise([ch] { ch->try_send(asio::error_code{}); });

    co_await ch->async_receive(asio::as_tuple(asio::use_awaitable));
}

shutdown_coordinator::shutdown_coordinator(asio::io_context& ioc,
                                           shutdown_signal& signal,
                                           std::shared_ptr<spdlog::logger> log)
    : m_signals(ioc), m_signal(signal), m_log(std::move(log))
{
    asio::error_code ec;

    m_signals.add(SIGINT, ec);
    if (ec) {
        throw signal_install_error("failed to install SIGINT signal handler: " + ec.message());
    }

#ifndef _WIN32
    m_signals.add(SIGTERM, ec);
    if (ec) {
        throw signal_install_error("failed to install SIGTERM signal handler: " + ec.message());
    }
#endif

    m_signals.async_wait([this](const asio::error_code& e, int signal_number) {
        on_signal(e, signal_number);
    });
}

void shutdown_coordinator::on_signal(const asio::error_code& ec, int signal_number) {
    if (ec) {
        // operation_aborted on teardown
        if (ec != asio::error::operation_aborted) {
            m_log->error("shutdown_coordinator: signal wait failed: {}", ec.message());
        }
        return;
    }

    const char* name = signal_number == SIGINT ? "SIGINT" : "SIGTERM";
    if (m_signal.raise()) {
        m_log->info("Got {}, shutting down", name);
    } else {
        m_log->debug("Got {} while already shutting down", name);
    }
}

} // namespace lifecore
