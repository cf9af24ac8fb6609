#include "middleware.hpp"
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <zlib.h>
#include <exception>
#include <utility>
#include <variant>

namespace lifecore {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

struct captured_response {
    http_response response;
    std::exception_ptr error;
};

// Lets the timeout race see a handler failure as a completion
asio::awaitable<captured_response> capture(const request_handler& handler, http_request req) {
    try {
        co_return captured_response{co_await handler(std::move(req)), nullptr};
    } catch (...) {
        co_return captured_response{http_response{}, std::current_exception()};
    }
}

} // anonymous namespace

layer observe_layer(std::shared_ptr<const span_propagator> spans) {
    return [spans](request_handler inner) -> request_handler {
        return [spans, inner = std::move(inner)](http_request req) -> asio::awaitable<http_response> {
            auto span = spans->make_span(req);
            auto start = std::chrono::steady_clock::now();

            http_response res;
            std::exception_ptr failure;
            try {
                res = co_await inner(std::move(req));
            } catch (const std::exception&) {
                failure = std::current_exception();
            }

            if (failure) {
                // Finish the span as the 500 the accept loop will answer
                http_response failed;
                failed.status = 500;
                spans->on_response(failed, std::chrono::steady_clock::now() - start, span);
                std::rethrow_exception(failure);
            }

            spans->on_response(res, std::chrono::steady_clock::now() - start, span);
            co_return res;
        };
    };
}

layer timeout_layer(std::chrono::milliseconds timeout) {
    return [timeout](request_handler inner) -> request_handler {
        return [timeout, inner = std::move(inner)](http_request req) -> asio::awaitable<http_response> {
            using namespace asio::experimental::awaitable_operators;

            asio::steady_timer timer(co_await asio::this_coro::executor);
            timer.expires_after(timeout);

            auto result = co_await (capture(inner, std::move(req)) || timer.async_wait(asio::use_awaitable));

            if (result.index() == 0) {
                auto captured = std::get<0>(std::move(result));
                if (captured.error) std::rethrow_exception(captured.error);
                co_return std::move(captured.response);
            }

            http_response res;
            res.status = 503;
            res.headers.set("Content-Type", "text/plain; charset=utf-8");
            res.body = "request timed out";
            co_return res;
        };
    };
}

layer compression_layer(std::size_t min_size) {
    return [min_size](request_handler inner) -> request_handler {
        return [min_size, inner = std::move(inner)](http_request req) -> asio::awaitable<http_response> {
            auto accept = req.headers.get("Accept-Encoding");
            bool gzip_ok = accept && accepts_gzip(*accept);

            auto res = co_await inner(std::move(req));

            if (!gzip_ok) co_return res;
            if (res.body.size() < min_size) co_return res;
            if (res.status == 204 || res.status == 304) co_return res;
            if (res.headers.contains("Content-Encoding") || res.headers.contains("Content-Range")) co_return res;

            auto compressed = gzip_compress(res.body);
            if (!compressed) co_return res;

            res.body = std::move(*compressed);
            res.headers.set("Content-Encoding", "gzip");
            res.headers.add("Vary", "Accept-Encoding");
            co_return res;
        };
    };
}

layer sensitive_headers_layer(std::vector<std::string> names) {
    return [names = std::move(names)](request_handler inner) -> request_handler {
        return [names, inner = std::move(inner)](http_request req) -> asio::awaitable<http_response> {
            for (const auto& n : names) req.headers.mark_sensitive(n);

            auto res = co_await inner(std::move(req));

            for (const auto& n : names) res.headers.mark_sensitive(n);
            co_return res;
        };
    };
}

pipeline_builder& pipeline_builder::add(layer l) {
    m_layers.push_back(std::move(l));
    return *this;
}

request_handler pipeline_builder::build(request_handler service) const {
    for (auto it = m_layers.rbegin(); it != m_layers.rend(); ++it) {
        service = (*it)(std::move(service));
    }
    return service;
}

bool accepts_gzip(std::string_view accept_encoding) {
    while (!accept_encoding.empty()) {
        auto comma = accept_encoding.find(',');
        auto item = trim(accept_encoding.substr(0, comma));
        accept_encoding = comma == std::string_view::npos
            ? std::string_view{} : accept_encoding.substr(comma + 1);

        auto semi = item.find(';');
        auto coding = trim(item.substr(0, semi));
        if (!iequals(coding, "gzip") && coding != "*") continue;

        if (semi != std::string_view::npos) {
            auto params = trim(item.substr(semi + 1));
            if (params == "q=0" || params == "q=0.0" || params == "q=0.00" || params == "q=0.000") {
                continue;
            }
        }
        return true;
    }
    return false;
}

std::optional<std::string> gzip_compress(std::string_view data) {
    z_stream zs{};
    // windowBits 15 + 16 selects the gzip wrapper
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    std::string out;
    out.resize(deflateBound(&zs, static_cast<uLong>(data.size())));

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);

    if (rc != Z_STREAM_END) {
        return std::nullopt;
    }

    out.resize(zs.total_out);
    return out;
}

} // namespace lifecore
