#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <utility>

namespace lifecore {

// Trace context extractors selectable from config
enum class propagator_kind {
    w3c,
    none
};

struct http_config {
    // Listener, "host:port"
    std::string address = "127.0.0.1:8080";
    uint32_t request_timeout_seconds = 10;
    bool compression = true;

    // Header names (lowercase) never printed in logs
    std::vector<std::string> sensitive_headers = {"authorization", "cookie"};
};

struct templates_config {
    // Roots searched in order; later roots override earlier ones
    std::vector<std::string> paths;
    std::vector<std::string> extensions = {".html", ".txt", ".xml"};
};

struct config {
    http_config http;
    templates_config templates;
    propagator_kind propagator = propagator_kind::w3c;

    // Hot-reload templates from filesystem notifications
    bool watch = false;

    // Operational: trace, debug, info, warn, error, critical or off
    std::string log_level = "info";

    // Threads running the io_context (0 = hardware_concurrency)
    unsigned int worker_threads = 0;
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse propagator_kind from string. Returns nullopt if invalid.
std::optional<propagator_kind> parse_propagator(const std::string& s);

// Split "host:port" (or "[v6]:port"). Returns nullopt if malformed.
std::optional<std::pair<std::string, uint16_t>> split_address(const std::string& address);

} // namespace lifecore
