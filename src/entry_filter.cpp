// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "entry_filter.h"

#include "config.h"
#include "data_errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace sportslog {

namespace {

std::string to_lower(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace

const char* entry_type_to_string(EntryType type) {
    switch (type) {
    case EntryType::EXERCISE:
        return "exercise";
    case EntryType::NOTE:
        return "note";
    case EntryType::WEIGHT:
        return "weight";
    }
    return "exercise";
}

std::optional<EntryType> entry_type_from_string(std::string_view str) {
    std::string lower = to_lower(str);
    if (lower == "exercise") {
        return EntryType::EXERCISE;
    }
    if (lower == "note") {
        return EntryType::NOTE;
    }
    if (lower == "weight") {
        return EntryType::WEIGHT;
    }
    return std::nullopt;
}

const char* comment_match_mode_to_string(CommentMatchMode mode) {
    return mode == CommentMatchMode::REGEX ? "regex" : "substring";
}

std::optional<CommentMatchMode> comment_match_mode_from_string(std::string_view str) {
    std::string lower = to_lower(str);
    if (lower == "substring") {
        return CommentMatchMode::SUBSTRING;
    }
    if (lower == "regex") {
        return CommentMatchMode::REGEX;
    }
    return std::nullopt;
}

CommentMatcher::CommentMatcher(const std::string& pattern, CommentMatchMode mode) : mode_(mode) {
    std::string trimmed = trim(pattern);
    if (trimmed.empty()) {
        return;
    }
    active_ = true;

    if (mode_ == CommentMatchMode::SUBSTRING) {
        needle_ = to_lower(trimmed);
        return;
    }

    try {
        regex_ = std::regex(trimmed, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        spdlog::warn("[EntryFilter] Invalid comment regex '{}': {}", trimmed, e.what());
        throw PatternSyntaxError(trimmed, e.what());
    }
}

bool CommentMatcher::matches(const std::string& comment) const {
    if (!active_) {
        return true;
    }
    if (mode_ == CommentMatchMode::REGEX) {
        return std::regex_search(comment, regex_);
    }
    return to_lower(comment).find(needle_) != std::string::npos;
}

bool matches_base_criteria(const Entry& entry, const EntryFilter& filter,
                           const CommentMatcher& comment_matcher) {
    const Date& date = entry.date_time.date;
    if (filter.date_start && date < *filter.date_start) {
        return false;
    }
    if (filter.date_end && date > *filter.date_end) {
        return false;
    }
    return comment_matcher.matches(entry.comment);
}

EntryFilter default_entry_filter(const Date& today) {
    EntryFilter filter;
    Config* config = Config::get_instance();

    std::string type_str = config->get<std::string>("/filter/entry_type", "exercise");
    if (auto type = entry_type_from_string(type_str)) {
        filter.entry_type = *type;
    } else {
        spdlog::warn("[EntryFilter] Unknown entry type '{}' in config, using exercise", type_str);
    }

    std::string mode_str = config->get<std::string>("/filter/comment_mode", "substring");
    if (auto mode = comment_match_mode_from_string(mode_str)) {
        filter.comment_mode = *mode;
    } else {
        spdlog::warn("[EntryFilter] Unknown comment mode '{}' in config, using substring",
                     mode_str);
    }

    int days_back = std::clamp(config->get<int>("/filter/days_back", 31), 1, 3650);
    filter.date_start = add_days(today, -days_back);
    filter.date_end = today;

    spdlog::debug("[EntryFilter] Default filter: {} from {} to {}, comment mode {}",
                  entry_type_to_string(filter.entry_type), to_string(*filter.date_start),
                  to_string(*filter.date_end), comment_match_mode_to_string(filter.comment_mode));
    return filter;
}

} // namespace sportslog
