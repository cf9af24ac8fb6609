#pragma once

#include "change_source.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace lifecore {

#ifdef __linux__

// change_source over Linux inotify. Each subscription owns one inotify
// descriptor watching the root and every directory below it; directories
// created later are added as they appear.
class inotify_change_source : public change_source {
public:
    explicit inotify_change_source(std::shared_ptr<spdlog::logger> log);

    // Canonical path of an existing directory. Throws otherwise.
    asio::awaitable<root_handle> resolve_root(const std::string& path) override;

    asio::awaitable<std::unique_ptr<subscription>> subscribe(const root_handle& root) override;

private:
    std::shared_ptr<spdlog::logger> m_log;
};

#endif

// Platform change source, or nullptr where none is available.
std::unique_ptr<change_source> make_platform_change_source(std::shared_ptr<spdlog::logger> log);

} // namespace lifecore
