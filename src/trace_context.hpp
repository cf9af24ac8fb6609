#pragma once

#include "config.hpp"
#include "http_message.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace lifecore {

using trace_id = std::array<uint8_t, 16>;
using span_id = std::array<uint8_t, 8>;

struct trace_context {
    trace_id trace{};
    span_id span{};
    uint8_t flags = 0;
    // Set only when the context was received from an upstream caller
    bool remote = false;

    // Both ids non-zero
    bool is_valid() const;
    bool is_remote() const { return remote; }
    bool sampled() const { return (flags & 0x01) != 0; }
};

std::string to_hex(const trace_id& id);
std::string to_hex(const span_id& id);

// Random non-zero ids
trace_id new_trace_id();
span_id new_span_id();

// Reads a trace context out of request headers.
class text_map_propagator {
public:
    virtual ~text_map_propagator() = default;

    // Returns a default (invalid, local) context when nothing usable is present.
    virtual trace_context extract(const http_headers& headers) const = 0;
};

// W3C Trace Context `traceparent` header.
class w3c_trace_propagator : public text_map_propagator {
public:
    trace_context extract(const http_headers& headers) const override;

    // Default (invalid) context on any format error.
    static trace_context parse_traceparent(std::string_view value);
};

// Never finds a parent.
class noop_propagator : public text_map_propagator {
public:
    trace_context extract(const http_headers&) const override { return {}; }
};

std::shared_ptr<const text_map_propagator> make_propagator(propagator_kind kind);

} // namespace lifecore
