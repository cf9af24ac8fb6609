#include "multi_root_watcher.hpp"
#include "errors.hpp"
#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace lifecore {

asio::awaitable<std::unique_ptr<multi_root_watcher>> multi_root_watcher::open(
    change_source& source,
    const std::vector<std::string>& roots,
    std::shared_ptr<spdlog::logger> log)
{
    if (roots.empty()) {
        throw setup_error("no watch roots configured");
    }

    auto executor = co_await asio::this_coro::executor;

    std::vector<branch> subscriptions;
    subscriptions.reserve(roots.size());

    for (const auto& root : roots) {
        root_handle resolved;
        std::unique_ptr<subscription> sub;
        std::string failure;

        try {
            resolved = co_await source.resolve_root(root);
        } catch (const std::exception& e) {
            failure = std::string("could not resolve watch root '") + root + "': " + e.what();
        }

        if (failure.empty()) {
            try {
                sub = co_await source.subscribe(resolved);
                if (!sub) failure = "could not subscribe to '" + resolved.path + "'";
            } catch (const std::exception& e) {
                failure = std::string("could not subscribe to '") + resolved.path + "': " + e.what();
            }
        }

        // Subscriptions opened so far are released with `subscriptions`
        if (!failure.empty()) {
            throw setup_error(failure);
        }

        log->info("multi_root_watcher: subscribed to '{}'", resolved.path);
        subscriptions.push_back({resolved.path, std::shared_ptr<subscription>(std::move(sub))});
    }

    auto watcher = std::make_unique<multi_root_watcher>(
        private_tag{}, executor, std::move(subscriptions), std::move(log));
    watcher->start();
    co_return watcher;
}

multi_root_watcher::multi_root_watcher(private_tag,
                                       asio::any_io_executor executor,
                                       std::vector<branch> subscriptions,
                                       std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_subscriptions(std::move(subscriptions)),
      m_channel(std::make_shared<channel>(executor, 0)),
      m_live(m_subscriptions.size())
{}

multi_root_watcher::~multi_root_watcher() {
    // Pumps blocked on send see channel_closed and exit
    m_channel->close();
}

void multi_root_watcher::start() {
    for (const auto& b : m_subscriptions) {
        asio::co_spawn(m_channel->get_executor(), pump(m_channel, b), asio::detached);
    }
}

asio::awaitable<void> multi_root_watcher::pump(std::shared_ptr<channel> ch, branch b) {
    for (;;) {
        branch_event ev;
        ev.root = b.root;

        try {
            auto item = co_await b.sub->next();
            if (item) {
                ev.type = branch_event::kind::data;
                ev.data = std::move(*item);
            } else {
                ev.type = branch_event::kind::ended;
            }
        } catch (const std::exception& e) {
            ev.type = branch_event::kind::failed;
            ev.error = e.what();
        }

        auto type = ev.type;
        auto [ec] = co_await ch->async_send(
            asio::error_code{}, std::move(ev), asio::as_tuple(asio::use_awaitable));

        // Closed: the watcher is gone or the merge already failed
        if (ec) co_return;
        if (type != branch_event::kind::data) co_return;
    }
}

asio::awaitable<std::optional<change_event_batch>> multi_root_watcher::next() {
    for (;;) {
        if (m_failure) {
            throw stream_error(*m_failure);
        }
        if (m_live == 0) {
            co_return std::nullopt;
        }

        auto [ec, ev] = co_await m_channel->async_receive(asio::as_tuple(asio::use_awaitable));
        if (ec) {
            m_failure = "change stream closed: " + ec.message();
            continue;
        }

        switch (ev.type) {
            case branch_event::kind::data:
                if (ev.data.type == subscription_data::kind::files_changed && ev.data.files) {
                    co_return change_event_batch{std::move(ev.root), std::move(*ev.data.files)};
                }
                m_log->debug("multi_root_watcher: dropped control message from '{}'", ev.root);
                break;

            case branch_event::kind::ended:
                --m_live;
                m_log->info("multi_root_watcher: subscription for '{}' ended ({} remaining)",
                           ev.root, m_live);
                break;

            case branch_event::kind::failed:
                m_failure = "subscription for '" + ev.root + "' failed: " + ev.error;
                // Release pumps of the other roots
                m_channel->close();
                break;
        }
    }
}

} // namespace lifecore
