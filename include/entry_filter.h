// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "date_time.h"
#include "entry.h"

#include <optional>
#include <regex>
#include <string>
#include <string_view>

/**
 * @file entry_filter.h
 * @brief Filter criteria for the calendar and list views
 *
 * Every criterion is optional; an unset criterion matches everything. The
 * entry type selects which list the filter applies to, the other lists pass
 * through unchanged.
 */

namespace sportslog {

enum class EntryType {
    EXERCISE,
    NOTE,
    WEIGHT,
};

const char* entry_type_to_string(EntryType type);

/// Parse "exercise", "note", "weight" (case-insensitive)
std::optional<EntryType> entry_type_from_string(std::string_view str);

/**
 * @brief How the comment pattern is matched
 *
 * SUBSTRING ignores case, REGEX is case-sensitive.
 */
enum class CommentMatchMode {
    SUBSTRING,
    REGEX,
};

const char* comment_match_mode_to_string(CommentMatchMode mode);

/// Parse "substring", "regex" (case-insensitive)
std::optional<CommentMatchMode> comment_match_mode_from_string(std::string_view str);

/**
 * @brief Filter criteria
 *
 * Sport type, subtype and equipment are compared by ID, so a filter built
 * before the reference data was reloaded keeps matching.
 */
struct EntryFilter {
    EntryType entry_type = EntryType::EXERCISE;

    std::optional<Date> date_start; ///< Inclusive
    std::optional<Date> date_end;   ///< Inclusive

    std::optional<int> sport_type_id;
    std::optional<int> sport_subtype_id;
    std::optional<int> equipment_id;
    std::optional<IntensityType> intensity;

    std::string comment_pattern; ///< Trimmed before use, empty = no criterion
    CommentMatchMode comment_mode = CommentMatchMode::SUBSTRING;
};

/**
 * @brief Compiled comment criterion of a filter
 *
 * Built once per filter run so that a malformed regular expression is
 * reported before any entry is examined.
 */
class CommentMatcher {
  public:
    /**
     * @throws PatternSyntaxError in REGEX mode for a malformed pattern
     */
    CommentMatcher(const std::string& pattern, CommentMatchMode mode);

    /**
     * @brief Check a comment against the pattern (always true without pattern)
     */
    [[nodiscard]] bool matches(const std::string& comment) const;

    [[nodiscard]] bool is_active() const {
        return active_;
    }

  private:
    bool active_ = false;
    CommentMatchMode mode_;
    std::string needle_; ///< Lowercased for SUBSTRING mode
    std::regex regex_;
};

/**
 * @brief Date range and comment check shared by all entry types
 */
[[nodiscard]] bool matches_base_criteria(const Entry& entry, const EntryFilter& filter,
                                         const CommentMatcher& comment_matcher);

/**
 * @brief Filter shown when the application starts
 *
 * Entry type, comment mode and the number of days back from @p today are
 * read from the config (/filter/entry_type, /filter/comment_mode,
 * /filter/days_back).
 */
[[nodiscard]] EntryFilter default_entry_filter(const Date& today);

} // namespace sportslog
