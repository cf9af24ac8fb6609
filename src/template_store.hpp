#pragma once

#include "config.hpp"
#include "snapshot_cell.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lifecore {

using template_vars = std::unordered_map<std::string, std::string>;

struct template_segment {
    bool placeholder = false;
    // Literal text, or the variable name for placeholders
    std::string text;
};

struct compiled_template {
    std::string name;
    std::string source_path;
    bool escape_html = false;
    std::vector<template_segment> segments;
};

// Immutable, versioned bundle of compiled templates.
// Shared by request handlers via shared_ptr<const template_snapshot>.
struct template_snapshot {
    uint64_t version = 0;
    std::unordered_map<std::string, compiled_template> templates;

    bool contains(const std::string& name) const;

    // Throws std::out_of_range for an unknown template name.
    std::string render(const std::string& name, const template_vars& vars) const;
};

// Compile `{{ name }}` placeholders. Throws reload_error with file and line
// on an unterminated or empty placeholder.
compiled_template compile_template(const std::string& name,
                                   const std::string& source,
                                   const std::string& source_path);

std::string escape_html(const std::string& s);

// What the reload loop needs from a template owner.
class template_provider {
public:
    virtual ~template_provider() = default;

    // Directories to observe for changes, in configuration order.
    virtual std::vector<std::string> watch_roots() const = 0;

    // Rebuild and atomically publish a new snapshot. Throws reload_error;
    // the previous snapshot stays live on failure.
    virtual void reload() = 0;
};

// Loads templates from the configured roots. Writers serialize on a mutex
// and publish complete snapshots; readers never lock.
class template_store : public template_provider {
public:
    // Performs the initial load. Throws reload_error if it fails.
    template_store(const templates_config& cfg, std::shared_ptr<spdlog::logger> log);

    std::vector<std::string> watch_roots() const override;
    void reload() override;

    std::shared_ptr<const template_snapshot> snapshot() const;

private:
    std::shared_ptr<const template_snapshot> build_snapshot(uint64_t version) const;
    bool wanted_extension(const std::string& ext) const;

    templates_config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    // Serializes reloads
    std::mutex m_write_mutex;
    snapshot_cell<template_snapshot> m_current;
};

} // namespace lifecore
