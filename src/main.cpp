#include "config.hpp"
#include "errors.hpp"
#include "inotify_change_source.hpp"
#include "service.hpp"
#include "shutdown_signal.hpp"
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

int main(int argc, char* argv[]) {
    cxxopts::Options options("lifecore_server",
        "Template server with hot reload, trace propagation and graceful shutdown");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("w,watch", "Watch for changes for templates on the filesystem")
        ("a,address", "Listener address host:port (overrides config)", cxxopts::value<std::string>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 1;
    }

    if (result.count("help") || !result.count("config")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("lifecore");

    // Load config
    lifecore::config cfg;
    try {
        cfg = lifecore::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // CLI overrides
    if (result.count("address")) cfg.http.address = result["address"].as<std::string>();
    if (result.count("watch"))   cfg.watch = true;
    if (result.count("verbose")) cfg.log_level = "debug";

    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    unsigned int effective_workers = cfg.worker_threads > 0
        ? cfg.worker_threads
        : std::thread::hardware_concurrency();
    if (effective_workers == 0) effective_workers = 1;

    console->info("lifecore starting");
    console->info("  listen:    {}", cfg.http.address);
    console->info("  templates: {} roots", cfg.templates.paths.size());
    console->info("  watch:     {}", cfg.watch ? "yes" : "no");
    console->info("  workers:   {}", effective_workers);

    asio::io_context ioc(static_cast<int>(effective_workers));

    // Graceful shutdown. Without listeners there is no safe way to stop.
    lifecore::shutdown_signal shutdown;
    std::unique_ptr<lifecore::shutdown_coordinator> signals;
    try {
        signals = std::make_unique<lifecore::shutdown_coordinator>(ioc, shutdown, console);
    } catch (const lifecore::signal_install_error& e) {
        console->critical("{}", e.what());
        return 1;
    }

    std::unique_ptr<lifecore::change_source> source;
    if (cfg.watch) {
        source = lifecore::make_platform_change_source(console);
    }

    auto svc = std::make_unique<lifecore::service>(ioc, cfg, console);

    int exit_code = 0;
    asio::co_spawn(ioc, svc->run(shutdown, source.get()),
        [&](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    console->error("{}", e.what());
                }
                exit_code = 1;
            }
            // Serving is over; a still running watch loop is dropped here
            ioc.stop();
        }
    );

    // Run the event loop on the worker pool
    std::vector<std::thread> workers;
    workers.reserve(effective_workers - 1);
    for (unsigned int i = 1; i < effective_workers; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) t.join();

    // Tear down while the io_context still exists
    svc.reset();
    signals.reset();

    console->info("lifecore stopped");
    return exit_code;
}
