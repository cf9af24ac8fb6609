#pragma once

#include "http_message.hpp"
#include "trace_context.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace lifecore {

// Coarse outcome recorded as otel.status_code
enum class span_status {
    unset,
    ok,
    error
};

std::string_view to_string(span_status s);

// 2xx/3xx -> ok, 4xx/5xx -> error, anything else -> unset
span_status classify_status(uint16_t status);

// One traced request. Created at request entry, finished on response.
struct request_span {
    trace_id trace{};
    span_id span{};
    // Remote parent span; empty for a fresh root
    std::optional<span_id> parent;

    std::string method;
    std::string target;
    std::string flavor;
    std::optional<std::string> user_agent;
    std::string kind = "server";

    // Filled in on response
    std::optional<span_status> status;
    std::optional<uint16_t> http_status_code;
    std::chrono::nanoseconds latency{0};
    // Response headers as printed in logs, sensitive values redacted
    std::string response_headers;

    bool is_root() const { return !parent.has_value(); }
};

// Receives finished spans.
class span_sink {
public:
    virtual ~span_sink() = default;
    virtual void on_end(const request_span& span) = 0;
};

// Writes one log record per finished request.
class log_span_sink : public span_sink {
public:
    explicit log_span_sink(std::shared_ptr<spdlog::logger> log) : m_log(std::move(log)) {}
    void on_end(const request_span& span) override;

private:
    std::shared_ptr<spdlog::logger> m_log;
};

class span_propagator {
public:
    span_propagator(std::shared_ptr<const text_map_propagator> propagator,
                    std::shared_ptr<span_sink> sink);

    // Parent to the extracted context only if it is a valid remote one.
    request_span make_span(const http_request& req) const;

    // Record status fields and hand the span to the sink.
    void on_response(const http_response& res, std::chrono::nanoseconds latency,
                     request_span& span) const;

private:
    std::shared_ptr<const text_map_propagator> m_propagator;
    std::shared_ptr<span_sink> m_sink;
};

} // namespace lifecore
