#include "http_message.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace lifecore {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

bool valid_token(std::string_view s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || std::string_view("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) != std::string_view::npos;
    });
}

} // anonymous namespace

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view flavor_string(http_version v) {
    switch (v) {
        case http_version::http_09: return "0.9";
        case http_version::http_10: return "1.0";
        case http_version::http_11: return "1.1";
        case http_version::http_2:  return "2.0";
        case http_version::http_3:  return "3.0";
        case http_version::unknown: break;
    }
    return "";
}

http_version parse_version(std::string_view s) {
    if (s == "HTTP/0.9")                   return http_version::http_09;
    if (s == "HTTP/1.0")                   return http_version::http_10;
    if (s == "HTTP/1.1")                   return http_version::http_11;
    if (s == "HTTP/2" || s == "HTTP/2.0")  return http_version::http_2;
    if (s == "HTTP/3" || s == "HTTP/3.0")  return http_version::http_3;
    return http_version::unknown;
}

void http_headers::add(std::string name, std::string value) {
    bool sensitive = is_sensitive(name);
    m_entries.push_back({std::move(name), std::move(value), sensitive});
}

void http_headers::set(std::string name, std::string value) {
    bool sensitive = is_sensitive(name);
    erase(name);
    m_entries.push_back({std::move(name), std::move(value), sensitive});
}

void http_headers::erase(std::string_view name) {
    m_entries.erase(
        std::remove_if(m_entries.begin(), m_entries.end(),
                       [&](const http_header& h) { return iequals(h.name, name); }),
        m_entries.end());
}

const http_header* http_headers::find(std::string_view name) const {
    for (const auto& h : m_entries) {
        if (iequals(h.name, name)) return &h;
    }
    return nullptr;
}

std::optional<std::string> http_headers::get(std::string_view name) const {
    if (auto h = find(name)) return h->value;
    return std::nullopt;
}

void http_headers::mark_sensitive(std::string_view name) {
    for (auto& h : m_entries) {
        if (iequals(h.name, name)) h.sensitive = true;
    }
}

bool http_headers::is_sensitive(std::string_view name) const {
    auto h = find(name);
    return h && h->sensitive;
}

std::string http_headers::describe() const {
    std::string out;
    for (const auto& h : m_entries) {
        if (!out.empty()) out += ", ";
        out += h.name;
        out += ": ";
        out += h.sensitive ? "<redacted>" : h.value;
    }
    return out;
}

std::string http_request::path() const {
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

std::string http_request::query() const {
    auto q = target.find('?');
    return q == std::string::npos ? std::string{} : target.substr(q + 1);
}

http_request parse_request_head(std::string_view head) {
    http_request req;

    auto eol = head.find("\r\n");
    auto request_line = head.substr(0, eol);
    head = eol == std::string_view::npos ? std::string_view{} : head.substr(eol + 2);

    // METHOD SP target SP version
    auto sp1 = request_line.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos) {
        throw http_parse_error("malformed request line");
    }

    auto method = request_line.substr(0, sp1);
    if (!valid_token(method)) {
        throw http_parse_error("invalid method");
    }
    req.method = std::string(method);

    if (sp2 == std::string_view::npos) {
        // HTTP/0.9 simple request: "GET /path"
        req.target = std::string(request_line.substr(sp1 + 1));
        req.version = http_version::http_09;
    } else {
        req.target = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
        req.version = parse_version(request_line.substr(sp2 + 1));
    }

    if (req.target.empty()) {
        throw http_parse_error("empty request target");
    }

    while (!head.empty()) {
        eol = head.find("\r\n");
        auto line = head.substr(0, eol);
        head = eol == std::string_view::npos ? std::string_view{} : head.substr(eol + 2);
        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string_view::npos || !valid_token(line.substr(0, colon))) {
            throw http_parse_error("malformed header line");
        }
        req.headers.add(std::string(line.substr(0, colon)),
                        std::string(trim(line.substr(colon + 1))));
    }

    return req;
}

std::size_t content_length(const http_request& req) {
    if (auto te = req.headers.get("Transfer-Encoding")) {
        if (!iequals(trim(*te), "identity")) {
            throw http_parse_error("unsupported transfer encoding: " + *te);
        }
    }

    auto value = req.headers.get("Content-Length");
    if (!value) return 0;

    auto v = trim(*value);
    std::size_t len = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), len);
    if (ec != std::errc{} || ptr != v.data() + v.size()) {
        throw http_parse_error("invalid Content-Length");
    }
    return len;
}

bool keep_alive(const http_request& req) {
    auto conn = req.headers.get("Connection");
    switch (req.version) {
        case http_version::http_11:
            return !(conn && iequals(trim(*conn), "close"));
        case http_version::http_10:
            return conn && iequals(trim(*conn), "keep-alive");
        default:
            return false;
    }
}

std::string_view reason_phrase(uint16_t status) {
    switch (status) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        case 505: return "HTTP Version Not Supported";
        default:  return "";
    }
}

std::string serialize_response(const http_response& res, http_version version, bool keep_alive) {
    std::string out;
    out.reserve(128 + res.body.size());

    out += version == http_version::http_10 ? "HTTP/1.0 " : "HTTP/1.1 ";
    out += std::to_string(res.status);
    out += ' ';
    out += reason_phrase(res.status);
    out += "\r\n";

    for (const auto& h : res.headers) {
        if (iequals(h.name, "Content-Length") || iequals(h.name, "Connection")) continue;
        out += h.name;
        out += ": ";
        out += h.value;
        out += "\r\n";
    }

    out += "Content-Length: ";
    out += std::to_string(res.body.size());
    out += "\r\n";
    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";
    out += res.body;
    return out;
}

} // namespace lifecore
