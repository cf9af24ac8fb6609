#pragma once

#include "change_source.hpp"
#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lifecore {

// Fan-in over one subscription per watch root.
//
// Setup is all-or-nothing: open() either subscribes every root or throws
// setup_error. At run time each root feeds a pump coroutine that hands its
// items to a rendezvous channel, so a root's own order is kept and no root
// reads ahead of the consumer. The first failing root ends the merge.
class multi_root_watcher {
    struct private_tag {
        explicit private_tag() = default;
    };

    struct branch {
        std::string root;
        std::shared_ptr<subscription> sub;
    };

public:
    static asio::awaitable<std::unique_ptr<multi_root_watcher>> open(
        change_source& source,
        const std::vector<std::string>& roots,
        std::shared_ptr<spdlog::logger> log);

    // Use open()
    multi_root_watcher(private_tag, asio::any_io_executor executor,
                       std::vector<branch> subscriptions,
                       std::shared_ptr<spdlog::logger> log);

    ~multi_root_watcher();

    multi_root_watcher(const multi_root_watcher&) = delete;
    multi_root_watcher& operator=(const multi_root_watcher&) = delete;

    // Next files-changed batch from any root. Control traffic is dropped.
    // Returns nullopt once every root ended; throws stream_error after the
    // first root failure (and on every later call).
    asio::awaitable<std::optional<change_event_batch>> next();

    std::size_t root_count() const { return m_subscriptions.size(); }

private:
    struct branch_event {
        enum class kind { data, ended, failed };

        kind type = kind::data;
        std::string root;
        subscription_data data;
        std::string error;
    };

    using channel = asio::experimental::concurrent_channel<void(asio::error_code, branch_event)>;

    void start();

    static asio::awaitable<void> pump(std::shared_ptr<channel> ch, branch b);

    std::shared_ptr<spdlog::logger> m_log;
    std::vector<branch> m_subscriptions;
    std::shared_ptr<channel> m_channel;

    std::size_t m_live = 0;
    std::optional<std::string> m_failure;
};

} // namespace lifecore
