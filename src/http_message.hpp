#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lifecore {

enum class http_version {
    http_09,
    http_10,
    http_11,
    http_2,
    http_3,
    unknown
};

// "0.9", "1.0", "1.1", "2.0", "3.0"; empty for unknown.
std::string_view flavor_string(http_version v);

// Parses "HTTP/x.y". Unrecognized versions map to http_version::unknown.
http_version parse_version(std::string_view s);

struct http_header {
    std::string name;
    std::string value;
    // Value must not appear in logs
    bool sensitive = false;
};

// Ordered header list with case-insensitive lookup.
class http_headers {
public:
    using const_iterator = std::vector<http_header>::const_iterator;

    void add(std::string name, std::string value);
    // Replace all values of `name` with one
    void set(std::string name, std::string value);
    void erase(std::string_view name);

    const http_header* find(std::string_view name) const;
    std::optional<std::string> get(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name) != nullptr; }

    void mark_sensitive(std::string_view name);
    bool is_sensitive(std::string_view name) const;

    // "name: value, ..." with sensitive values replaced
    std::string describe() const;

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }
    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

private:
    std::vector<http_header> m_entries;
};

struct http_request {
    std::string method;
    std::string target;
    http_version version = http_version::http_11;
    http_headers headers;
    std::string body;

    // Target without the query string
    std::string path() const;
    // Raw query string, without '?'
    std::string query() const;
};

struct http_response {
    uint16_t status = 200;
    http_headers headers;
    std::string body;
};

struct http_parse_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

bool iequals(std::string_view a, std::string_view b);

// Parse the request line and headers (everything before the blank line).
// Throws http_parse_error.
http_request parse_request_head(std::string_view head);

// Declared body length; 0 when absent. Throws http_parse_error on a bad value
// or on chunked transfer encoding, which is not supported.
std::size_t content_length(const http_request& req);

// Whether the connection may serve another request after this one.
bool keep_alive(const http_request& req);

std::string_view reason_phrase(uint16_t status);

// Status line, headers (Content-Length and Connection added) and body.
std::string serialize_response(const http_response& res, http_version version, bool keep_alive);

} // namespace lifecore
