// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

using json = nlohmann::json;

namespace sportslog {

/**
 * @brief JSON-backed application settings (sportslog.json)
 *
 * Values are addressed by JSON pointer ("/filter/days_back").
 *
 * ## Config Format
 *
 * ```json
 * {
 *   "log_level": "info",
 *   "filter": {
 *     "entry_type": "exercise",
 *     "comment_mode": "substring",
 *     "days_back": 31
 *   }
 * }
 * ```
 *
 * @note Not thread-safe; read and written from the UI thread only.
 */
class Config {
  public:
    Config();

    /**
     * @brief Process-wide instance (holds defaults until init() is called)
     */
    static Config* get_instance();

    /**
     * @brief Load settings from @p config_path
     *
     * A missing file is created with the defaults. A malformed file is logged
     * and the defaults are used (the file is left untouched).
     *
     * @return true if the file was loaded or created
     */
    bool init(const std::string& config_path);

    /**
     * @brief Get value at a JSON pointer
     * @throws nlohmann::json::type_error if the key is missing or has another type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    }

    /**
     * @brief Get value at a JSON pointer, or @p default_value if missing or mistyped
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr) || data.at(ptr).is_null()) {
            return default_value;
        }
        try {
            return data.at(ptr).template get<T>();
        } catch (const json::type_error& e) {
            spdlog::warn("[Config] Wrong type at {}, using default: {}", json_ptr, e.what());
            return default_value;
        }
    }

    /**
     * @brief Set value at a JSON pointer (in memory, call save() to persist)
     */
    template <typename T> void set(const std::string& json_ptr, const T& value) {
        data[json::json_pointer(json_ptr)] = value;
    }

    /**
     * @brief Write settings to the file given to init()
     * @return false if init() was never called or writing failed
     */
    bool save();

    [[nodiscard]] const std::string& path() const {
        return path_;
    }

    /**
     * @brief Settings written to a new config file
     */
    static json default_config();

  protected:
    json data;
    std::string path_;

    friend class ConfigTestFixture;
};

} // namespace sportslog
