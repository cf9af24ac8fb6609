#include "template_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace lifecore {

namespace {

bool valid_variable_name(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw reload_error("cannot open template: " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw reload_error("failed to read template: " + path.string());
    }
    return ss.str();
}

} // anonymous namespace

std::string escape_html(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default:   out += c;        break;
        }
    }
    return out;
}

compiled_template compile_template(const std::string& name,
                                   const std::string& source,
                                   const std::string& source_path) {
    compiled_template tpl;
    tpl.name = name;
    tpl.source_path = source_path;

    auto ext = fs::path(name).extension().string();
    tpl.escape_html = (ext == ".html" || ext == ".htm" || ext == ".xml");

    std::size_t pos = 0;
    std::size_t line = 1;
    while (pos < source.size()) {
        auto open = source.find("{{", pos);
        if (open == std::string::npos) {
            tpl.segments.push_back({false, source.substr(pos)});
            break;
        }

        if (open > pos) {
            tpl.segments.push_back({false, source.substr(pos, open - pos)});
        }
        line += static_cast<std::size_t>(std::count(source.begin() + pos, source.begin() + open, '\n'));

        auto close = source.find("}}", open + 2);
        if (close == std::string::npos) {
            throw reload_error(source_path + ":" + std::to_string(line) +
                               ": unterminated placeholder");
        }

        auto var = trim(source.substr(open + 2, close - open - 2));
        if (!valid_variable_name(var)) {
            throw reload_error(source_path + ":" + std::to_string(line) +
                               ": invalid placeholder '" + var + "'");
        }

        line += static_cast<std::size_t>(std::count(source.begin() + open, source.begin() + close, '\n'));
        tpl.segments.push_back({true, std::move(var)});
        pos = close + 2;
    }

    return tpl;
}

bool template_snapshot::contains(const std::string& name) const {
    return templates.find(name) != templates.end();
}

std::string template_snapshot::render(const std::string& name, const template_vars& vars) const {
    const auto& tpl = templates.at(name);

    std::string out;
    for (const auto& seg : tpl.segments) {
        if (!seg.placeholder) {
            out += seg.text;
            continue;
        }
        auto it = vars.find(seg.text);
        if (it == vars.end()) continue;
        out += tpl.escape_html ? escape_html(it->second) : it->second;
    }
    return out;
}

template_store::template_store(const templates_config& cfg, std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_log(std::move(log))
{
    auto snap = build_snapshot(1);
    m_log->info("template_store: loaded {} templates from {} roots",
               snap->templates.size(), m_cfg.paths.size());
    m_current.store(std::move(snap));
}

std::vector<std::string> template_store::watch_roots() const {
    return m_cfg.paths;
}

bool template_store::wanted_extension(const std::string& ext) const {
    return std::find(m_cfg.extensions.begin(), m_cfg.extensions.end(), ext) != m_cfg.extensions.end();
}

std::shared_ptr<const template_snapshot> template_store::build_snapshot(uint64_t version) const {
    auto snap = std::make_shared<template_snapshot>();
    snap->version = version;

    for (const auto& root_str : m_cfg.paths) {
        fs::path root(root_str);
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            throw reload_error("template root is not a directory: " + root_str);
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw reload_error("cannot list template root " + root_str + ": " + ec.message());
        }

        try {
            for (const auto& entry : it) {
                if (!entry.is_regular_file()) continue;
                if (!wanted_extension(entry.path().extension().string())) continue;

                auto name = entry.path().lexically_relative(root).generic_string();
                auto source = read_file(entry.path());

                // Later roots override earlier ones
                snap->templates[name] = compile_template(name, source, entry.path().string());
            }
        } catch (const fs::filesystem_error& e) {
            throw reload_error("cannot walk template root " + root_str + ": " + e.what());
        }
    }

    return snap;
}

void template_store::reload() {
    std::lock_guard<std::mutex> lock(m_write_mutex);

    auto current = m_current.load();
    auto next = build_snapshot(current->version + 1);

    m_log->info("template_store: published snapshot v{} ({} templates)",
               next->version, next->templates.size());
    m_current.store(std::move(next));
}

std::shared_ptr<const template_snapshot> template_store::snapshot() const {
    return m_current.load();
}

} // namespace lifecore
