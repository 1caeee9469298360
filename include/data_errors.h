// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <stdexcept>
#include <string>

namespace sportslog {

/**
 * @brief An id lookup into an id-keyed list failed
 *
 * Raised when reference data handed over after an edit does not contain an id
 * that an entry still refers to. Not recoverable locally; the reference data
 * update upstream is inconsistent.
 */
class ReferenceNotFound : public std::out_of_range {
  public:
    ReferenceNotFound(const std::string& kind, int id)
        : std::out_of_range(kind + " with ID " + std::to_string(id) + " not found"), kind_(kind),
          id_(id) {}

    /// Kind of object that was looked up (e.g. "SportType")
    [[nodiscard]] const std::string& kind() const {
        return kind_;
    }

    [[nodiscard]] int id() const {
        return id_;
    }

  private:
    std::string kind_;
    int id_;
};

/**
 * @brief Malformed regular expression in a comment filter
 *
 * The caller is expected to re-prompt for a corrected pattern.
 */
class PatternSyntaxError : public std::invalid_argument {
  public:
    PatternSyntaxError(const std::string& pattern, const std::string& reason)
        : std::invalid_argument("Invalid regular expression '" + pattern + "': " + reason),
          pattern_(pattern) {}

    [[nodiscard]] const std::string& pattern() const {
        return pattern_;
    }

  private:
    std::string pattern_;
};

} // namespace sportslog
