#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <stdexcept>

namespace lifecore {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> as_string_list(const YAML::Node& node, const char* key) {
    if (!node.IsSequence()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a list");
    }
    std::vector<std::string> out;
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

} // anonymous namespace

std::optional<propagator_kind> parse_propagator(const std::string& s) {
    if (s == "w3c" || s == "tracecontext") return propagator_kind::w3c;
    if (s == "none")                       return propagator_kind::none;
    return std::nullopt;
}

std::optional<std::pair<std::string, uint16_t>> split_address(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon == address.size() - 1) {
        return std::nullopt;
    }

    std::string host = address.substr(0, colon);
    if (host.front() == '[') {
        if (host.size() < 3 || host.back() != ']') return std::nullopt;
        host = host.substr(1, host.size() - 2);
    }

    auto port_str = address.substr(colon + 1);
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) return std::nullopt;

    return std::make_pair(std::move(host), port);
}

config load_config(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    config cfg;

    // HTTP listener
    if (auto http = root["http"]) {
        if (auto n = http["address"])                 cfg.http.address = n.as<std::string>();
        if (auto n = http["request_timeout_seconds"]) cfg.http.request_timeout_seconds = n.as<uint32_t>();
        if (auto n = http["compression"])             cfg.http.compression = n.as<bool>();
        if (auto n = http["sensitive_headers"]) {
            cfg.http.sensitive_headers.clear();
            for (auto& h : as_string_list(n, "http.sensitive_headers")) {
                cfg.http.sensitive_headers.push_back(to_lower(h));
            }
        }
    }

    if (cfg.http.request_timeout_seconds == 0) {
        throw std::runtime_error("config: 'http.request_timeout_seconds' must be positive");
    }

    if (!split_address(cfg.http.address)) {
        throw std::runtime_error("config: invalid 'http.address': " + cfg.http.address);
    }

    // Templates (required)
    if (auto tpl = root["templates"]) {
        if (auto n = tpl["paths"]) {
            cfg.templates.paths = as_string_list(n, "templates.paths");
        }
        if (auto n = tpl["extensions"]) {
            cfg.templates.extensions = as_string_list(n, "templates.extensions");
        }
    } else {
        throw std::runtime_error("config: 'templates' is required");
    }

    if (cfg.templates.paths.empty()) {
        throw std::runtime_error("config: 'templates.paths' must not be empty");
    }

    // Tracing
    if (auto tracing = root["tracing"]) {
        if (auto n = tracing["propagator"]) {
            auto kind = parse_propagator(n.as<std::string>());
            if (!kind) throw std::runtime_error("config: invalid 'tracing.propagator': " + n.as<std::string>());
            cfg.propagator = *kind;
        }
    }

    // Operational
    if (auto n = root["watch"])          cfg.watch = n.as<bool>();
    if (auto n = root["log_level"])      cfg.log_level = to_lower(n.as<std::string>());
    if (auto n = root["worker_threads"]) cfg.worker_threads = n.as<unsigned int>();

    static const char* const levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::find(std::begin(levels), std::end(levels), cfg.log_level) == std::end(levels)) {
        throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
    }

    return cfg;
}

} // namespace lifecore
