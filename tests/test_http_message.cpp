#include "http_message.hpp"
#include <gtest/gtest.h>

using lifecore::http_version;

TEST(http_message, parse_request_head) {
    auto req = lifecore::parse_request_head(
        "GET /about.html?lang=en HTTP/1.1\r\n"
        "Host: example.org\r\n"
        "User-Agent:  curl/8.0 \r\n"
        "Accept-Encoding: gzip\r\n"
        "\r\n");

    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.target, "/about.html?lang=en");
    EXPECT_EQ(req.path(), "/about.html");
    EXPECT_EQ(req.query(), "lang=en");
    EXPECT_EQ(req.version, http_version::http_11);
    EXPECT_EQ(req.headers.size(), 3u);
    EXPECT_EQ(req.headers.get("user-agent"), "curl/8.0");
}

TEST(http_message, simple_request_is_http09) {
    auto req = lifecore::parse_request_head("GET /index.html\r\n\r\n");
    EXPECT_EQ(req.version, http_version::http_09);
    EXPECT_EQ(req.target, "/index.html");
}

TEST(http_message, unknown_version_is_kept) {
    auto req = lifecore::parse_request_head("GET / HTTP/4.2\r\n\r\n");
    EXPECT_EQ(req.version, http_version::unknown);
}

TEST(http_message, malformed_heads_rejected) {
    EXPECT_THROW(lifecore::parse_request_head("GARBAGE\r\n\r\n"), lifecore::http_parse_error);
    EXPECT_THROW(lifecore::parse_request_head("G(T / HTTP/1.1\r\n\r\n"), lifecore::http_parse_error);
    EXPECT_THROW(lifecore::parse_request_head("GET / HTTP/1.1\r\nno colon here\r\n\r\n"),
                 lifecore::http_parse_error);
}

TEST(http_message, versions_and_flavors) {
    EXPECT_EQ(lifecore::parse_version("HTTP/1.0"), http_version::http_10);
    EXPECT_EQ(lifecore::parse_version("HTTP/2"), http_version::http_2);
    EXPECT_EQ(lifecore::parse_version("HTTP/3.0"), http_version::http_3);
    EXPECT_EQ(lifecore::parse_version("HTTP/1.2"), http_version::unknown);

    EXPECT_EQ(lifecore::flavor_string(http_version::http_09), "0.9");
    EXPECT_EQ(lifecore::flavor_string(http_version::http_10), "1.0");
    EXPECT_EQ(lifecore::flavor_string(http_version::http_11), "1.1");
    EXPECT_EQ(lifecore::flavor_string(http_version::http_2), "2.0");
    EXPECT_EQ(lifecore::flavor_string(http_version::http_3), "3.0");
    EXPECT_EQ(lifecore::flavor_string(http_version::unknown), "");
}

TEST(http_message, content_length) {
    auto req = lifecore::parse_request_head("POST / HTTP/1.1\r\nContent-Length: 12\r\n\r\n");
    EXPECT_EQ(lifecore::content_length(req), 12u);

    auto none = lifecore::parse_request_head("GET / HTTP/1.1\r\n\r\n");
    EXPECT_EQ(lifecore::content_length(none), 0u);

    auto bad = lifecore::parse_request_head("POST / HTTP/1.1\r\nContent-Length: 1x\r\n\r\n");
    EXPECT_THROW(lifecore::content_length(bad), lifecore::http_parse_error);

    auto chunked = lifecore::parse_request_head("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
    EXPECT_THROW(lifecore::content_length(chunked), lifecore::http_parse_error);
}

TEST(http_message, keep_alive_rules) {
    EXPECT_TRUE(lifecore::keep_alive(lifecore::parse_request_head("GET / HTTP/1.1\r\n\r\n")));
    EXPECT_FALSE(lifecore::keep_alive(lifecore::parse_request_head("GET / HTTP/1.1\r\nConnection: close\r\n\r\n")));
    EXPECT_FALSE(lifecore::keep_alive(lifecore::parse_request_head("GET / HTTP/1.0\r\n\r\n")));
    EXPECT_TRUE(lifecore::keep_alive(lifecore::parse_request_head("GET / HTTP/1.0\r\nConnection: Keep-Alive\r\n\r\n")));
    EXPECT_FALSE(lifecore::keep_alive(lifecore::parse_request_head("GET /\r\n\r\n")));
}

TEST(http_headers, case_insensitive_lookup_and_set) {
    lifecore::http_headers headers;
    headers.add("Vary", "Accept");
    headers.add("vary", "Origin");
    EXPECT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers.get("VARY"), "Accept");

    headers.set("Vary", "Accept-Encoding");
    EXPECT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.get("vary"), "Accept-Encoding");

    headers.erase("VARY");
    EXPECT_TRUE(headers.empty());
    EXPECT_FALSE(headers.get("Vary").has_value());
}

TEST(http_headers, sensitive_values_redacted) {
    lifecore::http_headers headers;
    headers.add("Authorization", "Bearer secret-token");
    headers.add("Accept", "text/html");
    headers.mark_sensitive("authorization");

    EXPECT_TRUE(headers.is_sensitive("Authorization"));
    EXPECT_FALSE(headers.is_sensitive("Accept"));

    auto text = headers.describe();
    EXPECT_EQ(text.find("secret-token"), std::string::npos) << text;
    EXPECT_NE(text.find("Authorization: <redacted>"), std::string::npos) << text;
    EXPECT_NE(text.find("Accept: text/html"), std::string::npos) << text;

    // The value itself is untouched
    EXPECT_EQ(headers.get("Authorization"), "Bearer secret-token");

    // Replacing a sensitive header keeps it sensitive
    headers.set("Authorization", "Bearer other");
    EXPECT_TRUE(headers.is_sensitive("Authorization"));
}

TEST(http_message, serialize_response) {
    lifecore::http_response res;
    res.status = 404;
    res.headers.set("Content-Type", "text/plain");
    res.headers.set("Content-Length", "999");
    res.body = "not found";

    auto out = lifecore::serialize_response(res, http_version::http_11, true);

    EXPECT_EQ(out.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u) << out;
    EXPECT_NE(out.find("Content-Length: 9\r\n"), std::string::npos) << out;
    EXPECT_EQ(out.find("999"), std::string::npos) << out;
    EXPECT_NE(out.find("Connection: keep-alive\r\n"), std::string::npos) << out;
    EXPECT_EQ(out.substr(out.size() - 11), "\r\nnot found") << out;

    auto closing = lifecore::serialize_response(res, http_version::http_10, false);
    EXPECT_EQ(closing.rfind("HTTP/1.0 404", 0), 0u) << closing;
    EXPECT_NE(closing.find("Connection: close\r\n"), std::string::npos) << closing;
}
