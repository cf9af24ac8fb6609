#include "inotify_change_source.hpp"

#ifdef __linux__

#include <asio/as_tuple.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <sys/inotify.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unordered_map>

namespace fs = std::filesystem;

namespace lifecore {

namespace {

constexpr uint32_t watch_mask =
    IN_CLOSE_WRITE | IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO |
    IN_DELETE_SELF | IN_MOVE_SELF;

class inotify_subscription : public subscription {
public:
    inotify_subscription(asio::any_io_executor executor, int fd, std::string root,
                         std::shared_ptr<spdlog::logger> log)
        : m_stream(executor, fd), m_root(std::move(root)), m_log(std::move(log))
    {
        add_tree("");
    }

    asio::awaitable<std::optional<subscription_data>> next() override {
        if (m_ended) co_return std::nullopt;

        auto [ec, n] = co_await m_stream.async_read_some(
            asio::buffer(m_buffer), asio::as_tuple(asio::use_awaitable));

        if (ec == asio::error::eof || ec == asio::error::operation_aborted) {
            m_ended = true;
            co_return std::nullopt;
        }
        if (ec) {
            throw std::system_error(ec, "inotify read on '" + m_root + "'");
        }

        co_return decode(n);
    }

private:
    // Watch `rel` (relative to the root) and every directory below it.
    void add_tree(const std::string& rel) {
        fs::path dir = rel.empty() ? fs::path(m_root) : fs::path(m_root) / rel;
        add_watch(dir, rel);

        std::error_code ec;
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) return;

        for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) break;
            std::error_code sec;
            if (it->is_directory(sec)) {
                add_watch(it->path(), it->path().lexically_relative(m_root).generic_string());
            }
        }
    }

    void add_watch(const fs::path& dir, const std::string& rel) {
        int wd = inotify_add_watch(m_stream.native_handle(), dir.c_str(), watch_mask);
        if (wd < 0) {
            // The root itself must be watchable; subdirectories may vanish under us
            if (rel.empty()) {
                throw std::system_error(errno, std::generic_category(),
                                        "inotify_add_watch '" + dir.string() + "'");
            }
            m_log->debug("inotify: cannot watch '{}': {}", dir.string(), std::strerror(errno));
            return;
        }
        m_dirs[wd] = rel;
    }

    subscription_data decode(std::size_t n) {
        subscription_data data;
        data.root = m_root;

        std::vector<std::string> files;
        bool changed = false;

        std::size_t offset = 0;
        while (offset + sizeof(inotify_event) <= n) {
            auto* ev = reinterpret_cast<const inotify_event*>(m_buffer.data() + offset);
            offset += sizeof(inotify_event) + ev->len;

            if (ev->mask & IN_Q_OVERFLOW) {
                // Events were lost; report a change with no names so the whole tree is reloaded
                m_log->warn("inotify: event queue overflow on '{}'", m_root);
                changed = true;
                continue;
            }

            auto dir_it = m_dirs.find(ev->wd);
            if (dir_it == m_dirs.end()) continue;
            const std::string dir_rel = dir_it->second;

            if (ev->mask & IN_IGNORED) {
                m_dirs.erase(dir_it);
                if (dir_rel.empty()) {
                    m_ended = true;
                    data.type = subscription_data::kind::canceled;
                    return data;
                }
                continue;
            }

            if (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) continue;
            if (ev->len == 0) continue;

            std::string name = dir_rel.empty() ? std::string(ev->name) : dir_rel + "/" + ev->name;

            if ((ev->mask & IN_ISDIR) && (ev->mask & (IN_CREATE | IN_MOVED_TO))) {
                add_tree(name);
            }

            changed = true;
            if (std::find(files.begin(), files.end(), name) == files.end()) {
                files.push_back(std::move(name));
            }
        }

        if (changed) {
            data.type = subscription_data::kind::files_changed;
            data.files = std::move(files);
        } else {
            data.type = subscription_data::kind::heartbeat;
        }
        return data;
    }

    asio::posix::stream_descriptor m_stream;
    std::string m_root;
    std::shared_ptr<spdlog::logger> m_log;

    // wd -> directory relative to the root ("" for the root)
    std::unordered_map<int, std::string> m_dirs;
    alignas(inotify_event) std::array<char, 64 * 1024> m_buffer{};
    bool m_ended = false;
};

} // anonymous namespace

inotify_change_source::inotify_change_source(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{}

asio::awaitable<root_handle> inotify_change_source::resolve_root(const std::string& path) {
    auto canonical = fs::canonical(path);
    if (!fs::is_directory(canonical)) {
        throw std::runtime_error("not a directory: " + canonical.string());
    }
    co_return root_handle{canonical.string()};
}

asio::awaitable<std::unique_ptr<subscription>> inotify_change_source::subscribe(const root_handle& root) {
    auto executor = co_await asio::this_coro::executor;

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "inotify_init1");
    }

    // The stream descriptor owns fd from here, also when add_tree throws
    co_return std::make_unique<inotify_subscription>(executor, fd, root.path, m_log);
}

std::unique_ptr<change_source> make_platform_change_source(std::shared_ptr<spdlog::logger> log) {
    return std::make_unique<inotify_change_source>(std::move(log));
}

} // namespace lifecore

#else

namespace lifecore {

std::unique_ptr<change_source> make_platform_change_source(std::shared_ptr<spdlog::logger>) {
    return nullptr;
}

} // namespace lifecore

#endif
