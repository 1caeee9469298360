// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace sportslog {

Config::Config() : data(default_config()) {}

Config* Config::get_instance() {
    static Config instance;
    return &instance;
}

json Config::default_config() {
    return {{"log_level", "info"},
            {"filter", {{"entry_type", "exercise"}, {"comment_mode", "substring"}, {"days_back", 31}}}};
}

bool Config::init(const std::string& config_path) {
    path_ = config_path;

    if (!fs::exists(config_path)) {
        spdlog::info("[Config] {} not found, creating with defaults", config_path);
        data = default_config();
        return save();
    }

    std::ifstream in(config_path);
    if (!in) {
        spdlog::error("[Config] Cannot open {}, using defaults", config_path);
        data = default_config();
        return false;
    }

    try {
        json loaded = json::parse(in);
        if (!loaded.is_object()) {
            spdlog::error("[Config] {} is not a JSON object, using defaults", config_path);
            data = default_config();
            return false;
        }
        // Keys missing from older files keep their default values
        data = default_config();
        data.merge_patch(loaded);
    } catch (const json::parse_error& e) {
        spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        data = default_config();
        return false;
    }

    spdlog::debug("[Config] Loaded {}", config_path);
    return true;
}

bool Config::save() {
    if (path_.empty()) {
        spdlog::error("[Config] Cannot save - no config path set");
        return false;
    }

    try {
        fs::path p(path_);
        if (p.has_parent_path()) {
            fs::create_directories(p.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        spdlog::error("[Config] Cannot create directory for {}: {}", path_, e.what());
        return false;
    }

    std::ofstream out(path_);
    if (!out) {
        spdlog::error("[Config] Cannot write {}", path_);
        return false;
    }
    out << data.dump(2) << "\n";
    out.flush();
    if (!out) {
        spdlog::error("[Config] Write to {} failed", path_);
        return false;
    }

    spdlog::debug("[Config] Saved {}", path_);
    return true;
}

} // namespace sportslog
