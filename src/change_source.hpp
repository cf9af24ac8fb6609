#pragma once

#include <asio/awaitable.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lifecore {

// A watch root after the change source accepted it.
struct root_handle {
    std::string path;
};

// One item produced by a subscription. Only files_changed carries a file
// list; the other kinds are control traffic.
struct subscription_data {
    enum class kind {
        files_changed,
        state_enter,
        state_leave,
        heartbeat,
        canceled
    };

    kind type = kind::heartbeat;
    std::string root;
    std::optional<std::vector<std::string>> files;
};

// Files changed below one root, names relative to that root.
struct change_event_batch {
    std::string root;
    std::vector<std::string> files;
};

// Per-root stream of subscription data. Lazy and non-restartable.
class subscription {
public:
    virtual ~subscription() = default;

    // Next item, or nullopt once the stream ended.
    // Throws on transport failure.
    virtual asio::awaitable<std::optional<subscription_data>> next() = 0;
};

// Filesystem change-notification capability.
class change_source {
public:
    virtual ~change_source() = default;

    // Throws if the path cannot be watched.
    virtual asio::awaitable<root_handle> resolve_root(const std::string& path) = 0;

    // Throws if the subscription cannot be created.
    virtual asio::awaitable<std::unique_ptr<subscription>> subscribe(const root_handle& root) = 0;
};

} // namespace lifecore
