#include "span_propagator.hpp"

namespace lifecore {

std::string_view to_string(span_status s) {
    switch (s) {
        case span_status::ok:    return "ok";
        case span_status::error: return "error";
        case span_status::unset: break;
    }
    return "unset";
}

span_status classify_status(uint16_t status) {
    if (status >= 200 && status < 400) return span_status::ok;
    if (status >= 400 && status < 600) return span_status::error;
    return span_status::unset;
}

void log_span_sink::on_end(const request_span& span) {
    auto latency_us = std::chrono::duration_cast<std::chrono::microseconds>(span.latency).count();

    m_log->info("request {} {} HTTP/{} -> {} otel.status_code={} otel.kind={} trace_id={} span_id={} parent={} user_agent={} latency={}us",
               span.method,
               span.target,
               span.flavor,
               span.http_status_code.value_or(0),
               to_string(span.status.value_or(span_status::unset)),
               span.kind,
               to_hex(span.trace),
               to_hex(span.span),
               span.parent ? to_hex(*span.parent) : std::string("-"),
               span.user_agent.value_or("-"),
               latency_us);

    if (!span.response_headers.empty()) {
        m_log->debug("request {} response headers: {}", to_hex(span.span), span.response_headers);
    }
}

span_propagator::span_propagator(std::shared_ptr<const text_map_propagator> propagator,
                                 std::shared_ptr<span_sink> sink)
    : m_propagator(std::move(propagator)), m_sink(std::move(sink))
{}

request_span span_propagator::make_span(const http_request& req) const {
    request_span span;

    auto cx = m_propagator ? m_propagator->extract(req.headers) : trace_context{};

    // A zero-value context would make every request a child of one empty trace
    if (cx.is_valid() && cx.is_remote()) {
        span.trace = cx.trace;
        span.parent = cx.span;
    } else {
        span.trace = new_trace_id();
    }
    span.span = new_span_id();

    span.method = req.method;
    span.target = req.target;
    span.flavor = std::string(flavor_string(req.version));

    if (auto ua = req.headers.get("User-Agent")) {
        span.user_agent = std::move(*ua);
    }

    return span;
}

void span_propagator::on_response(const http_response& res, std::chrono::nanoseconds latency,
                                  request_span& span) const {
    span.status = classify_status(res.status);
    span.http_status_code = res.status;
    span.latency = latency;
    span.response_headers = res.headers.describe();

    if (m_sink) m_sink->on_end(span);
}

} // namespace lifecore
