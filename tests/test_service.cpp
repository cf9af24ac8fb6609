#include "service.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <asio/as_tuple.hpp>
#include <asio/io_context.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <asio/write.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using lifecore::http_request;
using lifecore::http_response;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

class template_dir {
public:
    template_dir() {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_path = fs::temp_directory_path() / (std::string("lifecore_svc_") + info->name());
        fs::remove_all(m_path);
        fs::create_directories(m_path);
        write("index.html", "<h1>{{ title }}</h1>");
        write("hello.txt", "Hello {{ name }}!");
    }

    ~template_dir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(m_path / name, std::ios::trunc);
        out << content;
    }

    lifecore::templates_config config() const {
        lifecore::templates_config cfg;
        cfg.paths = {m_path.string()};
        return cfg;
    }

private:
    fs::path m_path;
};

http_request get(const std::string& target, const std::string& method = "GET") {
    http_request req;
    req.method = method;
    req.target = target;
    return req;
}

} // namespace

TEST(service_helpers, parse_query) {
    auto vars = lifecore::parse_query("name=J%C3%B6rg&title=a+b&flag&=skip&x=%zz");

    EXPECT_EQ(vars["name"], "J\xC3\xB6rg");
    EXPECT_EQ(vars["title"], "a b");
    EXPECT_EQ(vars["flag"], "");
    EXPECT_EQ(vars["x"], "%zz");
    EXPECT_TRUE(lifecore::parse_query("").empty());
}

TEST(service_helpers, parse_endpoint) {
    auto ep = lifecore::parse_endpoint("127.0.0.1:8080");
    EXPECT_EQ(ep.address().to_string(), "127.0.0.1");
    EXPECT_EQ(ep.port(), 8080);

    auto v6 = lifecore::parse_endpoint("[::1]:443");
    EXPECT_TRUE(v6.address().is_v6());

    EXPECT_THROW(lifecore::parse_endpoint("localhost:80"), std::runtime_error);
    EXPECT_THROW(lifecore::parse_endpoint("no-port"), std::runtime_error);
}

TEST(template_handler, renders_with_query_variables) {
    template_dir dir;
    auto store = std::make_shared<const lifecore::template_store>(dir.config(), make_log());
    auto handler = lifecore::make_template_handler(store);

    asio::io_context ioc;
    auto res = test_support::run(ioc, handler(get("/index.html?title=%3Cb%3E")));

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "<h1>&lt;b&gt;</h1>");
    EXPECT_EQ(res.headers.get("Content-Type"), "text/html; charset=utf-8");
    EXPECT_EQ(res.headers.get("X-Template-Version"), "1");
}

TEST(template_handler, root_maps_to_index) {
    template_dir dir;
    auto store = std::make_shared<const lifecore::template_store>(dir.config(), make_log());
    auto handler = lifecore::make_template_handler(store);

    asio::io_context ioc;
    auto res = test_support::run(ioc, handler(get("/?title=home")));
    EXPECT_EQ(res.body, "<h1>home</h1>");
}

TEST(template_handler, status_codes) {
    template_dir dir;
    auto store = std::make_shared<const lifecore::template_store>(dir.config(), make_log());
    auto handler = lifecore::make_template_handler(store);

    auto call = [&](http_request req) {
        asio::io_context ioc;
        return test_support::run(ioc, handler(std::move(req)));
    };

    EXPECT_EQ(call(get("/healthz")).status, 200);
    EXPECT_EQ(call(get("/missing.html")).status, 404);

    auto post = call(get("/index.html", "POST"));
    EXPECT_EQ(post.status, 405);
    EXPECT_EQ(post.headers.get("Allow"), "GET, HEAD");

    auto head = call(get("/hello.txt", "HEAD"));
    EXPECT_EQ(head.status, 200);
    EXPECT_TRUE(head.body.empty());
}

TEST(template_handler, sees_reloaded_templates) {
    template_dir dir;
    auto store = std::make_shared<lifecore::template_store>(dir.config(), make_log());
    auto handler = lifecore::make_template_handler(store);

    dir.write("hello.txt", "Bye {{ name }}.");
    store->reload();

    asio::io_context ioc;
    auto res = test_support::run(ioc, handler(get("/hello.txt?name=Ann")));
    EXPECT_EQ(res.body, "Bye Ann.");
    EXPECT_EQ(res.headers.get("X-Template-Version"), "2");
}

TEST(service, serves_until_shutdown) {
    template_dir dir;

    lifecore::config cfg;
    cfg.http.address = "127.0.0.1:0";
    cfg.templates = dir.config();

    asio::io_context ioc;
    lifecore::shutdown_signal shutdown;
    lifecore::service svc(ioc, cfg, make_log());

    std::string head;
    std::string body;
    auto client = [&]() -> asio::awaitable<void> {
        asio::ip::tcp::socket sock(co_await asio::this_coro::executor);
        co_await sock.async_connect(svc.local_endpoint(), asio::use_awaitable);

        std::string request =
            "GET /hello.txt?name=World HTTP/1.1\r\n"
            "Host: test\r\n"
            "Authorization: Bearer secret\r\n"
            "Connection: close\r\n\r\n";
        co_await asio::async_write(sock, asio::buffer(request), asio::use_awaitable);

        std::string buf;
        auto n = co_await asio::async_read_until(sock, asio::dynamic_buffer(buf), "\r\n\r\n",
                                                 asio::use_awaitable);
        head = buf.substr(0, n);

        // Connection: close, so the body runs to eof
        auto [ec, m] = co_await asio::async_read(sock, asio::dynamic_buffer(buf),
                                                 asio::as_tuple(asio::use_awaitable));
        body = buf.substr(n);

        shutdown.raise();
    };

    // run() binds before its first suspension, so the client can connect
    auto served = asio::co_spawn(ioc, svc.run(shutdown, nullptr), asio::use_future);
    auto done = asio::co_spawn(ioc, client(), asio::use_future);
    ioc.run();
    done.get();
    served.get();

    EXPECT_EQ(head.rfind("HTTP/1.1 200", 0), 0u) << head;
    EXPECT_NE(head.find("X-Template-Version: 1"), std::string::npos) << head;
    EXPECT_EQ(body, "Hello World!");
    EXPECT_EQ(svc.reloader(), nullptr);
}

TEST(service, startup_failures_name_the_step) {
    lifecore::config cfg;
    cfg.http.address = "127.0.0.1:0";
    cfg.templates.paths = {"/nonexistent/lifecore/templates"};

    asio::io_context ioc;
    lifecore::shutdown_signal shutdown;
    lifecore::service svc(ioc, cfg, make_log());

    auto served = asio::co_spawn(ioc, svc.run(shutdown, nullptr), asio::use_future);
    ioc.run();

    try {
        served.get();
        FAIL() << "expected startup failure";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("could not load templates", 0), 0u) << e.what();
    }
}

TEST(service, watch_without_change_source_fails) {
    template_dir dir;

    lifecore::config cfg;
    cfg.http.address = "127.0.0.1:0";
    cfg.templates = dir.config();
    cfg.watch = true;

    asio::io_context ioc;
    lifecore::shutdown_signal shutdown;
    lifecore::service svc(ioc, cfg, make_log());

    auto served = asio::co_spawn(ioc, svc.run(shutdown, nullptr), asio::use_future);
    ioc.run();

    try {
        served.get();
        FAIL() << "expected startup failure";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("could not watch for templates changes", 0), 0u) << e.what();
    }
}

TEST(service, watch_setup_failure_reported) {
    template_dir dir;

    lifecore::config cfg;
    cfg.http.address = "127.0.0.1:0";
    cfg.templates = dir.config();
    cfg.watch = true;

    test_support::fake_change_source source;
    source.unresolvable.insert(cfg.templates.paths[0]);

    asio::io_context ioc;
    lifecore::shutdown_signal shutdown;
    lifecore::service svc(ioc, cfg, make_log());

    auto served = asio::co_spawn(ioc, svc.run(shutdown, &source), asio::use_future);
    ioc.run();

    EXPECT_THROW(served.get(), std::runtime_error);
    EXPECT_FALSE(svc.reloader()->running());
}
