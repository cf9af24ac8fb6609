#include "trace_context.hpp"
#include <algorithm>
#include <random>

namespace lifecore {

namespace {

constexpr char hex_digits[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    // Uppercase is not allowed by the W3C format
    return -1;
}

template <std::size_t N>
bool decode_hex(std::string_view s, std::array<uint8_t, N>& out) {
    if (s.size() != N * 2) return false;
    for (std::size_t i = 0; i < N; ++i) {
        int hi = hex_value(s[2 * i]);
        int lo = hex_value(s[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

template <std::size_t N>
std::string encode_hex(const std::array<uint8_t, N>& in) {
    std::string out;
    out.reserve(N * 2);
    for (auto b : in) {
        out += hex_digits[b >> 4];
        out += hex_digits[b & 0x0f];
    }
    return out;
}

template <std::size_t N>
bool all_zero(const std::array<uint8_t, N>& a) {
    return std::all_of(a.begin(), a.end(), [](uint8_t b) { return b == 0; });
}

std::mt19937_64& rng() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

template <std::size_t N>
std::array<uint8_t, N> random_id() {
    std::array<uint8_t, N> id{};
    do {
        for (std::size_t i = 0; i < N; i += 8) {
            auto v = rng()();
            for (std::size_t j = 0; j < 8 && i + j < N; ++j) {
                id[i + j] = static_cast<uint8_t>(v >> (8 * j));
            }
        }
    } while (all_zero(id));
    return id;
}

} // anonymous namespace

bool trace_context::is_valid() const {
    return !all_zero(trace) && !all_zero(span);
}

std::string to_hex(const trace_id& id) { return encode_hex(id); }
std::string to_hex(const span_id& id)  { return encode_hex(id); }

trace_id new_trace_id() { return random_id<16>(); }
span_id new_span_id()   { return random_id<8>(); }

trace_context w3c_trace_propagator::parse_traceparent(std::string_view value) {
    // version-traceid-parentid-flags: 2-32-16-2 hex digits
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.remove_suffix(1);

    if (value.size() < 55) return {};
    if (value[2] != '-' || value[35] != '-' || value[52] != '-') return {};

    std::array<uint8_t, 1> version{};
    if (!decode_hex(value.substr(0, 2), version)) return {};
    // ff is forbidden; version 00 has no trailing fields
    if (version[0] == 0xff) return {};
    if (version[0] == 0x00 && value.size() != 55) return {};
    if (value.size() > 55 && value[55] != '-') return {};

    trace_context ctx;
    std::array<uint8_t, 1> flags{};
    if (!decode_hex(value.substr(3, 32), ctx.trace)) return {};
    if (!decode_hex(value.substr(36, 16), ctx.span)) return {};
    if (!decode_hex(value.substr(53, 2), flags)) return {};

    if (!ctx.is_valid()) return {};

    ctx.flags = flags[0];
    ctx.remote = true;
    return ctx;
}

trace_context w3c_trace_propagator::extract(const http_headers& headers) const {
    auto value = headers.get("traceparent");
    if (!value) return {};
    return parse_traceparent(*value);
}

std::shared_ptr<const text_map_propagator> make_propagator(propagator_kind kind) {
    switch (kind) {
        case propagator_kind::w3c:  return std::make_shared<w3c_trace_propagator>();
        case propagator_kind::none: break;
    }
    return std::make_shared<noop_propagator>();
}

} // namespace lifecore
