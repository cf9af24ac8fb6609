#include "http_server.hpp"
#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>
#include <stdexcept>

namespace lifecore {

class http_connection : public std::enable_shared_from_this<http_connection> {
public:
    http_connection(asio::ip::tcp::socket socket, http_server& server)
        : m_socket(std::move(socket)), m_server(server) {}

    asio::awaitable<void> run(std::shared_ptr<const request_handler> handler,
                              const shutdown_signal& shutdown);

    // Connection strand only. A connection between requests holds no work.
    void close_if_idle();

    asio::any_io_executor executor() { return m_socket.get_executor(); }

private:
    asio::awaitable<bool> serve_one(const request_handler& handler,
                                    const shutdown_signal& shutdown);
    asio::awaitable<void> write_error(uint16_t status, http_version version);
    void close();

    asio::ip::tcp::socket m_socket;
    http_server& m_server;
    std::string m_buffer;
    bool m_idle = true;
};

asio::awaitable<void> http_connection::run(std::shared_ptr<const request_handler> handler,
                                           const shutdown_signal& shutdown) {
    try {
        while (!shutdown.raised()) {
            if (!co_await serve_one(*handler, shutdown)) break;
        }
    } catch (const std::exception& e) {
        m_server.m_log->warn("http_server: connection error: {}", e.what());
    }

    close();

    auto self = shared_from_this();
    asio::post(m_server.m_strand, [self] {
        self->m_server.connection_finished(self.get());
    });
}

asio::awaitable<bool> http_connection::serve_one(const request_handler& handler,
                                                 const shutdown_signal& shutdown) {
    m_idle = true;

    auto [ec, head_len] = co_await asio::async_read_until(
        m_socket, asio::dynamic_buffer(m_buffer, http_server::max_head_bytes), "\r\n\r\n",
        asio::as_tuple(asio::use_awaitable));

    if (ec) {
        // eof, closed while idle, or an oversized head
        if (ec == asio::error::not_found) {
            co_await write_error(400, http_version::http_11);
        }
        co_return false;
    }

    m_idle = false;

    http_request req;
    std::size_t body_len = 0;
    bool malformed = false;

    try {
        req = parse_request_head(std::string_view(m_buffer.data(), head_len));
        body_len = content_length(req);
    } catch (const http_parse_error& e) {
        m_server.m_log->debug("http_server: bad request: {}", e.what());
        malformed = true;
    }

    if (malformed) {
        co_await write_error(400, http_version::http_11);
        co_return false;
    }

    if (req.version == http_version::unknown) {
        co_await write_error(505, http_version::http_11);
        co_return false;
    }

    if (body_len > http_server::max_body_bytes) {
        co_await write_error(413, req.version);
        co_return false;
    }

    std::size_t buffered = m_buffer.size() - head_len;
    if (buffered < body_len) {
        auto [rec, n] = co_await asio::async_read(
            m_socket, asio::dynamic_buffer(m_buffer), asio::transfer_exactly(body_len - buffered),
            asio::as_tuple(asio::use_awaitable));
        if (rec) co_return false;
    }

    req.body = m_buffer.substr(head_len, body_len);
    m_buffer.erase(0, head_len + body_len);

    auto version = req.version;
    bool persistent = keep_alive(req);

    http_response res;
    bool handler_failed = false;
    try {
        res = co_await handler(std::move(req));
    } catch (const std::exception& e) {
        m_server.m_log->error("http_server: handler failed: {}", e.what());
        handler_failed = true;
    }

    if (handler_failed) {
        res = http_response{};
        res.status = 500;
        res.headers.set("Content-Type", "text/plain; charset=utf-8");
        res.body = "internal server error";
    }

    // No new request on this connection once shutdown started
    persistent = persistent && !shutdown.raised();

    auto out = serialize_response(res, version, persistent);
    auto [wec, written] = co_await asio::async_write(
        m_socket, asio::buffer(out), asio::as_tuple(asio::use_awaitable));

    co_return !wec && persistent;
}

asio::awaitable<void> http_connection::write_error(uint16_t status, http_version version) {
    http_response res;
    res.status = status;
    res.headers.set("Content-Type", "text/plain; charset=utf-8");
    res.body = std::string(reason_phrase(status));

    auto out = serialize_response(res, version, false);
    auto [ec, n] = co_await asio::async_write(
        m_socket, asio::buffer(out), asio::as_tuple(asio::use_awaitable));
    if (ec) {
        m_server.m_log->debug("http_server: failed to write {} response: {}", status, ec.message());
    }
}

void http_connection::close_if_idle() {
    if (m_idle) close();
}

void http_connection::close() {
    if (!m_socket.is_open()) return;

    asio::error_code ec;
    m_socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    m_socket.close(ec);
}

http_server::http_server(asio::io_context& ioc, std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_log(std::move(log)),
      m_strand(asio::make_strand(ioc)),
      m_acceptor(m_strand),
      m_drained(m_strand)
{}

http_server::~http_server() {
    asio::error_code ec;
    m_acceptor.close(ec);
}

void http_server::listen(const asio::ip::tcp::endpoint& endpoint) {
    asio::error_code ec;

    m_acceptor.open(endpoint.protocol(), ec);
    if (!ec) m_acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) m_acceptor.bind(endpoint, ec);
    if (!ec) m_acceptor.listen(asio::socket_base::max_listen_connections, ec);

    if (ec) {
        asio::error_code ignored;
        m_acceptor.close(ignored);
        throw std::runtime_error("could not bind address " + endpoint.address().to_string() +
                                 ":" + std::to_string(endpoint.port()) + ": " + ec.message());
    }
}

asio::ip::tcp::endpoint http_server::local_endpoint() const {
    return m_acceptor.local_endpoint();
}

asio::awaitable<void> http_server::serve(request_handler handler, shutdown_signal& shutdown) {
    if (!m_acceptor.is_open()) {
        throw std::logic_error("http_server::serve called before listen");
    }

    shutdown.on_raise([this] {
        asio::post(m_strand, [this] { begin_shutdown(); });
    });

    auto shared_handler = std::make_shared<const request_handler>(std::move(handler));
    co_await asio::co_spawn(m_strand, accept_loop(shared_handler, shutdown), asio::use_awaitable);
}

asio::awaitable<void> http_server::accept_loop(std::shared_ptr<const request_handler> handler,
                                               const shutdown_signal& shutdown) {
    asio::steady_timer backoff(m_strand);

    while (!m_stopping) {
        auto conn_strand = asio::make_strand(m_ioc);
        auto [ec, socket] = co_await m_acceptor.async_accept(
            conn_strand, asio::as_tuple(asio::use_awaitable));

        if (ec) {
            if (m_stopping || !m_acceptor.is_open()) break;

            // Out of descriptors and the like: back off instead of spinning
            m_log->warn("http_server: accept failed: {}", ec.message());
            backoff.expires_after(std::chrono::milliseconds(100));
            co_await backoff.async_wait(asio::as_tuple(asio::use_awaitable));
            continue;
        }

        auto conn = std::make_shared<http_connection>(std::move(socket), *this);
        m_connections.emplace(conn.get(), conn);
        m_active_count.store(m_connections.size(), std::memory_order_relaxed);
        m_accepted.fetch_add(1, std::memory_order_relaxed);

        // The registry holds weak references; the coroutine owns the connection
        asio::co_spawn(conn->executor(),
            [conn, handler, &shutdown]() -> asio::awaitable<void> {
                co_await conn->run(handler, shutdown);
            },
            asio::detached);
    }

    m_log->info("http_server: stopped accepting, draining {} connections", m_connections.size());

    while (!m_connections.empty()) {
        m_drained.expires_at(asio::steady_timer::time_point::max());
        co_await m_drained.async_wait(asio::as_tuple(asio::use_awaitable));
    }

    m_log->info("http_server: all connections drained");
}

void http_server::begin_shutdown() {
    if (m_stopping) return;
    m_stopping = true;

    asio::error_code ec;
    m_acceptor.close(ec);

    for (auto& [ptr, weak] : m_connections) {
        if (auto conn = weak.lock()) {
            asio::post(conn->executor(), [conn] { conn->close_if_idle(); });
        }
    }
}

void http_server::connection_finished(http_connection* conn) {
    m_connections.erase(conn);
    m_active_count.store(m_connections.size(), std::memory_order_relaxed);

    if (m_connections.empty()) {
        m_drained.cancel();
    }
}

} // namespace lifecore
