#pragma once

#include "middleware.hpp"
#include "shutdown_signal.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace lifecore {

class http_connection;

// HTTP/1.x accept loop with graceful drain.
//
// The acceptor, the connection registry and the drain timer live on one
// strand. Each connection runs on its own strand. Once the shutdown signal
// is raised the acceptor is closed, idle keep-alive connections are closed,
// and serve() returns when the last busy connection has written its response.
class http_server {
public:
    static constexpr std::size_t max_head_bytes = 64 * 1024;
    static constexpr std::size_t max_body_bytes = 1024 * 1024;

    http_server(asio::io_context& ioc, std::shared_ptr<spdlog::logger> log);
    ~http_server();

    http_server(const http_server&) = delete;
    http_server& operator=(const http_server&) = delete;

    // Throws std::runtime_error if the address cannot be bound.
    void listen(const asio::ip::tcp::endpoint& endpoint);

    asio::ip::tcp::endpoint local_endpoint() const;

    // Accept until `shutdown` is raised, then drain. Requires listen().
    asio::awaitable<void> serve(request_handler handler, shutdown_signal& shutdown);

    std::size_t active_connections() const { return m_active_count.load(std::memory_order_relaxed); }
    uint64_t accepted_connections() const { return m_accepted.load(std::memory_order_relaxed); }

private:
    friend class http_connection;

    asio::awaitable<void> accept_loop(std::shared_ptr<const request_handler> handler,
                                      const shutdown_signal& shutdown);

    // Strand-only
    void begin_shutdown();
    void connection_finished(http_connection* conn);

    asio::io_context& m_ioc;
    std::shared_ptr<spdlog::logger> m_log;

    asio::strand<asio::io_context::executor_type> m_strand;
    asio::ip::tcp::acceptor m_acceptor;
    asio::steady_timer m_drained;

    // Strand-only
    bool m_stopping = false;
    std::unordered_map<http_connection*, std::weak_ptr<http_connection>> m_connections;

    std::atomic<std::size_t> m_active_count{0};
    std::atomic<uint64_t> m_accepted{0};
};

} // namespace lifecore
