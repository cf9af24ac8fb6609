#pragma once

#include <stdexcept>
#include <string>

namespace lifecore {

struct error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A watch root could not be resolved or subscribed. No watcher is created.
struct setup_error : error {
    using error::error;
};

// Template content could not be loaded or compiled. The previous snapshot stays live.
struct reload_error : error {
    using error::error;
};

// The change-notification transport failed mid-watch. Ends the watch loop.
struct stream_error : error {
    using error::error;
};

// SIGINT/SIGTERM listeners could not be installed. Fatal at startup.
struct signal_install_error : error {
    using error::error;
};

} // namespace lifecore
