// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "data_errors.h"
#include "entry_filter.h"

#include <catch2/catch_test_macros.hpp>

using namespace sportslog;

static Note make_note(const std::string& date_time, const std::string& comment) {
    Note note;
    note.id = 1;
    note.date_time = *parse_date_time(date_time);
    note.comment = comment;
    return note;
}

// ============================================================================
// CommentMatcher
// ============================================================================

TEST_CASE("CommentMatcher: empty or blank pattern matches everything", "[entry_filter][comment]") {
    CommentMatcher empty("", CommentMatchMode::SUBSTRING);
    CHECK_FALSE(empty.is_active());
    CHECK(empty.matches(""));
    CHECK(empty.matches("anything"));

    CommentMatcher blank("  \t ", CommentMatchMode::REGEX);
    CHECK_FALSE(blank.is_active());
    CHECK(blank.matches("anything"));
}

TEST_CASE("CommentMatcher: substring mode ignores case", "[entry_filter][comment]") {
    CommentMatcher matcher("Interval", CommentMatchMode::SUBSTRING);
    CHECK(matcher.is_active());
    CHECK(matcher.matches("5x1000m intervals on the track"));
    CHECK(matcher.matches("INTERVAL"));
    CHECK_FALSE(matcher.matches("easy run"));
    CHECK_FALSE(matcher.matches(""));
}

TEST_CASE("CommentMatcher: pattern is trimmed", "[entry_filter][comment]") {
    CommentMatcher matcher("  hill ", CommentMatchMode::SUBSTRING);
    CHECK(matcher.matches("Hill repeats"));
    CHECK(matcher.matches("uphill"));
}

TEST_CASE("CommentMatcher: substring mode treats regex characters literally",
          "[entry_filter][comment]") {
    CommentMatcher matcher("5x(1km)", CommentMatchMode::SUBSTRING);
    CHECK(matcher.matches("Track: 5x(1km) @ 4:00"));
    CHECK_FALSE(matcher.matches("5x1km"));
}

TEST_CASE("CommentMatcher: regex mode is case-sensitive search", "[entry_filter][comment]") {
    CommentMatcher matcher("[0-9]+ ?km", CommentMatchMode::REGEX);
    CHECK(matcher.matches("long run 25 km"));
    CHECK(matcher.matches("25km"));
    CHECK_FALSE(matcher.matches("long run"));

    CommentMatcher upper("Tempo", CommentMatchMode::REGEX);
    CHECK(upper.matches("Tempo run"));
    CHECK_FALSE(upper.matches("tempo run"));
}

TEST_CASE("CommentMatcher: malformed regex throws PatternSyntaxError", "[entry_filter][comment]") {
    SECTION("unbalanced parenthesis") {
        REQUIRE_THROWS_AS(CommentMatcher("(abc", CommentMatchMode::REGEX), PatternSyntaxError);
    }

    SECTION("unbalanced bracket") {
        REQUIRE_THROWS_AS(CommentMatcher("[abc", CommentMatchMode::REGEX), PatternSyntaxError);
    }

    SECTION("same text is fine in substring mode") {
        REQUIRE_NOTHROW(CommentMatcher("(abc", CommentMatchMode::SUBSTRING));
    }
}

// ============================================================================
// matches_base_criteria
// ============================================================================

TEST_CASE("matches_base_criteria: date range is inclusive", "[entry_filter][date]") {
    EntryFilter filter;
    filter.date_start = parse_date("2026-02-01");
    filter.date_end = parse_date("2026-02-28");
    CommentMatcher no_comment("", CommentMatchMode::SUBSTRING);

    CHECK(matches_base_criteria(make_note("2026-02-01 00:00", ""), filter, no_comment));
    CHECK(matches_base_criteria(make_note("2026-02-28 23:59:59", ""), filter, no_comment));
    CHECK_FALSE(matches_base_criteria(make_note("2026-01-31 23:59", ""), filter, no_comment));
    CHECK_FALSE(matches_base_criteria(make_note("2026-03-01 00:00", ""), filter, no_comment));
}

TEST_CASE("matches_base_criteria: open-ended date range", "[entry_filter][date]") {
    CommentMatcher no_comment("", CommentMatchMode::SUBSTRING);

    EntryFilter from_only;
    from_only.date_start = parse_date("2026-02-01");
    CHECK(matches_base_criteria(make_note("2030-01-01 12:00", ""), from_only, no_comment));
    CHECK_FALSE(matches_base_criteria(make_note("2025-12-31 12:00", ""), from_only, no_comment));

    EntryFilter until_only;
    until_only.date_end = parse_date("2026-02-01");
    CHECK(matches_base_criteria(make_note("1999-01-01 12:00", ""), until_only, no_comment));
    CHECK_FALSE(matches_base_criteria(make_note("2026-02-02 00:00", ""), until_only, no_comment));
}

TEST_CASE("matches_base_criteria: date and comment must both match", "[entry_filter]") {
    EntryFilter filter;
    filter.date_start = parse_date("2026-02-01");
    CommentMatcher matcher("race", CommentMatchMode::SUBSTRING);

    CHECK(matches_base_criteria(make_note("2026-02-10 09:00", "Race day"), filter, matcher));
    CHECK_FALSE(matches_base_criteria(make_note("2026-02-10 09:00", "Rest"), filter, matcher));
    CHECK_FALSE(matches_base_criteria(make_note("2026-01-10 09:00", "Race day"), filter, matcher));
}

// ============================================================================
// String conversion
// ============================================================================

TEST_CASE("IntensityType string conversion", "[entry_filter][intensity]") {
    CHECK(std::string(intensity_to_string(IntensityType::MAXIMUM)) == "maximum");
    CHECK(intensity_from_string("High") == IntensityType::HIGH);
    CHECK(intensity_from_string("minimum") == IntensityType::MINIMUM);
    CHECK_FALSE(intensity_from_string("hard").has_value());
}

TEST_CASE("EntryType string conversion", "[entry_filter]") {
    CHECK(std::string(entry_type_to_string(EntryType::WEIGHT)) == "weight");
    CHECK(entry_type_from_string("Exercise") == EntryType::EXERCISE);
    CHECK(entry_type_from_string("NOTE") == EntryType::NOTE);
    CHECK_FALSE(entry_type_from_string("workout").has_value());
}

TEST_CASE("CommentMatchMode string conversion", "[entry_filter]") {
    CHECK(std::string(comment_match_mode_to_string(CommentMatchMode::REGEX)) == "regex");
    CHECK(comment_match_mode_from_string("Substring") == CommentMatchMode::SUBSTRING);
    CHECK_FALSE(comment_match_mode_from_string("glob").has_value());
}

// ============================================================================
// default_entry_filter
// ============================================================================

class DefaultFilterConfigFixture {
  protected:
    Config* config = Config::get_instance();

    ~DefaultFilterConfigFixture() {
        config->set<std::string>("/filter/entry_type", "exercise");
        config->set<std::string>("/filter/comment_mode", "substring");
        config->set<int>("/filter/days_back", 31);
    }
};

TEST_CASE_METHOD(DefaultFilterConfigFixture, "default_entry_filter: uses config defaults",
                 "[entry_filter][config]") {
    Date today{2026, 3, 15};
    EntryFilter filter = default_entry_filter(today);

    CHECK(filter.entry_type == EntryType::EXERCISE);
    CHECK(filter.comment_mode == CommentMatchMode::SUBSTRING);
    REQUIRE(filter.date_start.has_value());
    REQUIRE(filter.date_end.has_value());
    CHECK(*filter.date_start == Date{2026, 2, 12});
    CHECK(*filter.date_end == today);
    CHECK_FALSE(filter.sport_type_id.has_value());
    CHECK(filter.comment_pattern.empty());
}

TEST_CASE_METHOD(DefaultFilterConfigFixture, "default_entry_filter: reads configured values",
                 "[entry_filter][config]") {
    config->set<std::string>("/filter/entry_type", "weight");
    config->set<std::string>("/filter/comment_mode", "regex");
    config->set<int>("/filter/days_back", 7);

    EntryFilter filter = default_entry_filter(Date{2026, 1, 3});
    CHECK(filter.entry_type == EntryType::WEIGHT);
    CHECK(filter.comment_mode == CommentMatchMode::REGEX);
    CHECK(*filter.date_start == Date{2025, 12, 27});
}

TEST_CASE_METHOD(DefaultFilterConfigFixture,
                 "default_entry_filter: invalid config values fall back",
                 "[entry_filter][config]") {
    config->set<std::string>("/filter/entry_type", "workout");
    config->set<std::string>("/filter/comment_mode", "glob");
    config->set<int>("/filter/days_back", -5);

    EntryFilter filter = default_entry_filter(Date{2026, 3, 15});
    CHECK(filter.entry_type == EntryType::EXERCISE);
    CHECK(filter.comment_mode == CommentMatchMode::SUBSTRING);
    // Clamped to one day
    CHECK(*filter.date_start == Date{2026, 3, 14});
}
