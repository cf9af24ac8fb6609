#pragma once

#include "http_message.hpp"
#include "span_propagator.hpp"
#include <asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lifecore {

using request_handler = std::function<asio::awaitable<http_response>(http_request)>;

// Wraps a handler into another handler.
using layer = std::function<request_handler(request_handler)>;

// Opens a span per request and finishes it with the response status.
// Does not touch the request or the response.
layer observe_layer(std::shared_ptr<const span_propagator> spans);

// Abandons the inner handler after `timeout` and answers 503.
layer timeout_layer(std::chrono::milliseconds timeout);

// gzip-encodes response bodies for clients that accept it.
layer compression_layer(std::size_t min_size = 32);

// Marks the named headers sensitive on both request and response.
layer sensitive_headers_layer(std::vector<std::string> names);

// Stacks layers around a service; the first layer added is the outermost.
class pipeline_builder {
public:
    pipeline_builder& add(layer l);
    request_handler build(request_handler service) const;

private:
    std::vector<layer> m_layers;
};

// Whether Accept-Encoding admits gzip.
bool accepts_gzip(std::string_view accept_encoding);

// Raw gzip stream of `data`. nullopt if zlib reports an error.
std::optional<std::string> gzip_compress(std::string_view data);

} // namespace lifecore
