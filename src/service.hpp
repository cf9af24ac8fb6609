#pragma once

#include "change_source.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "middleware.hpp"
#include "reload_coordinator.hpp"
#include "shutdown_signal.hpp"
#include "template_store.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace lifecore {

// Demo service: GET /healthz, and GET /<name> rendering template <name>
// from the snapshot current at request entry, query parameters as variables.
request_handler make_template_handler(std::shared_ptr<const template_store> templates);

// Decoded key/value pairs of an application/x-www-form-urlencoded string.
template_vars parse_query(const std::string& query);

// Throws std::runtime_error("could not parse listener address ...").
asio::ip::tcp::endpoint parse_endpoint(const std::string& address);

// Wires templates, hot reload, the middleware pipeline and the accept loop.
class service {
public:
    service(asio::io_context& ioc, const config& cfg,
            std::shared_ptr<spdlog::logger> log);

    // Start everything and serve until `shutdown` is raised, then drain.
    // `source` is required when cfg.watch is set. Startup failures throw
    // std::runtime_error carrying the failing step.
    asio::awaitable<void> run(shutdown_signal& shutdown, change_source* source);

    asio::ip::tcp::endpoint local_endpoint() const { return m_server.local_endpoint(); }
    std::shared_ptr<const template_store> templates() const { return m_templates; }
    std::shared_ptr<const reload_coordinator> reloader() const { return m_reloader; }

private:
    request_handler build_pipeline() const;

    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    http_server m_server;
    std::shared_ptr<template_store> m_templates;
    std::shared_ptr<reload_coordinator> m_reloader;
};

} // namespace lifecore
