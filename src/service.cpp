#include "service.hpp"
#include "span_propagator.hpp"
#include "trace_context.hpp"
#include <asio/ip/address.hpp>

namespace lifecore {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out += s[i];
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

http_response text_response(uint16_t status, std::string body) {
    http_response res;
    res.status = status;
    res.headers.set("Content-Type", "text/plain; charset=utf-8");
    res.body = std::move(body);
    return res;
}

std::string content_type_for(const std::string& name) {
    auto dot = name.rfind('.');
    auto ext = dot == std::string::npos ? std::string{} : name.substr(dot);
    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".xml")                   return "application/xml; charset=utf-8";
    return "text/plain; charset=utf-8";
}

} // anonymous namespace

template_vars parse_query(const std::string& query) {
    template_vars vars;
    std::string_view rest(query);
    while (!rest.empty()) {
        auto amp = rest.find('&');
        auto pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        auto key = url_decode(pair.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
        vars[std::move(key)] = std::move(value);
    }
    return vars;
}

asio::ip::tcp::endpoint parse_endpoint(const std::string& address) {
    auto parts = split_address(address);
    if (!parts) {
        throw std::runtime_error("could not parse listener address '" + address + "'");
    }

    asio::error_code ec;
    auto ip = asio::ip::make_address(parts->first, ec);
    if (ec) {
        throw std::runtime_error("could not parse listener address '" + address + "': " + ec.message());
    }
    return {ip, parts->second};
}

request_handler make_template_handler(std::shared_ptr<const template_store> templates) {
    return [templates](http_request req) -> asio::awaitable<http_response> {
        if (req.method != "GET" && req.method != "HEAD") {
            auto res = text_response(405, "method not allowed");
            res.headers.set("Allow", "GET, HEAD");
            co_return res;
        }

        auto path = url_decode(req.path());
        if (path == "/healthz") {
            co_return text_response(200, "ok");
        }

        auto name = path.size() > 1 ? path.substr(1) : std::string("index.html");

        // One snapshot for the whole render, whatever reloads happen meanwhile
        auto snap = templates->snapshot();
        if (!snap->contains(name)) {
            co_return text_response(404, "not found");
        }

        http_response res;
        res.status = 200;
        res.headers.set("Content-Type", content_type_for(name));
        res.headers.set("X-Template-Version", std::to_string(snap->version));
        if (req.method == "GET") {
            res.body = snap->render(name, parse_query(req.query()));
        }
        co_return res;
    };
}

service::service(asio::io_context& ioc, const config& cfg,
                 std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_log(std::move(log)),
      m_server(ioc, m_log)
{}

request_handler service::build_pipeline() const {
    auto spans = std::make_shared<const span_propagator>(
        make_propagator(m_cfg.propagator),
        std::make_shared<log_span_sink>(m_log));

    pipeline_builder builder;
    // Outermost first
    builder.add(observe_layer(spans));
    builder.add(timeout_layer(std::chrono::seconds(m_cfg.http.request_timeout_seconds)));
    if (m_cfg.http.compression) {
        builder.add(compression_layer());
    }
    builder.add(sensitive_headers_layer(m_cfg.http.sensitive_headers));

    return builder.build(make_template_handler(m_templates));
}

asio::awaitable<void> service::run(shutdown_signal& shutdown, change_source* source) {
    auto endpoint = parse_endpoint(m_cfg.http.address);
    m_server.listen(endpoint);

    // Load and compile the templates
    try {
        m_templates = std::make_shared<template_store>(m_cfg.templates, m_log);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("could not load templates: ") + e.what());
    }

    // Watch for changes in templates if requested
    if (m_cfg.watch) {
        if (!source) {
            throw std::runtime_error("could not watch for templates changes: "
                                     "no change source available on this platform");
        }

        m_reloader = std::make_shared<reload_coordinator>(*m_templates, shutdown, m_log);

        try {
            co_await watch_templates(*source, m_reloader, m_log);
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("could not watch for templates changes: ") + e.what());
        }
    }

    auto handler = build_pipeline();

    auto local = m_server.local_endpoint();
    m_log->info("Listening on http://{}:{}", local.address().to_string(), local.port());

    co_await m_server.serve(std::move(handler), shutdown);
}

} // namespace lifecore
