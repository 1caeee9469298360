// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "date_time.h"

#include <charconv>
#include <cstdio>
#include <ctime>

namespace sportslog {

namespace {

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int days_in_month(int y, int m) {
    static const int dm[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) {
        return 29;
    }
    return dm[m];
}

// Fixed-width unsigned field; from_chars alone would accept a leading '-'
bool parse_part(std::string_view part, int& out) {
    for (char c : part) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    auto res = std::from_chars(part.data(), part.data() + part.size(), out);
    return res.ec == std::errc{} && res.ptr == part.data() + part.size();
}

} // namespace

bool Date::is_valid() const {
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= days_in_month(year, month);
}

// Civil-from-days conversion works on 400-year eras starting at March 1st,
// so leap days fall at the end of each shifted year.
int days_from_epoch(const Date& date) {
    const int y = date.month <= 2 ? date.year - 1 : date.year;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const int yoe = y - era * 400;
    const int mp = (date.month + 9) % 12;
    const int doy = (153 * mp + 2) / 5 + date.day - 1;
    const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date date_from_epoch_days(int days) {
    const int z = days + 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const int doe = z - era * 146097;
    const int yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int mp = (5 * doy + 2) / 153;

    Date result;
    result.day = doy - (153 * mp + 2) / 5 + 1;
    result.month = mp < 10 ? mp + 3 : mp - 9;
    result.year = yoe + era * 400 + (result.month <= 2 ? 1 : 0);
    return result;
}

Date add_days(const Date& date, int days) {
    return date_from_epoch_days(days_from_epoch(date) + days);
}

std::optional<Date> parse_date(std::string_view s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        return std::nullopt;
    }

    Date date;
    if (!parse_part(s.substr(0, 4), date.year) || !parse_part(s.substr(5, 2), date.month) ||
        !parse_part(s.substr(8, 2), date.day)) {
        return std::nullopt;
    }
    if (!date.is_valid()) {
        return std::nullopt;
    }
    return date;
}

std::optional<DateTime> parse_date_time(std::string_view s) {
    if (s.size() != 16 && s.size() != 19) {
        return std::nullopt;
    }
    if ((s[10] != ' ' && s[10] != 'T') || s[13] != ':') {
        return std::nullopt;
    }

    auto date = parse_date(s.substr(0, 10));
    if (!date) {
        return std::nullopt;
    }

    DateTime result;
    result.date = *date;
    if (!parse_part(s.substr(11, 2), result.hour) || !parse_part(s.substr(14, 2), result.minute)) {
        return std::nullopt;
    }
    if (s.size() == 19) {
        if (s[16] != ':' || !parse_part(s.substr(17, 2), result.second)) {
            return std::nullopt;
        }
    }

    if (result.hour > 23 || result.minute > 59 || result.second > 59) {
        return std::nullopt;
    }
    return result;
}

std::string to_string(const Date& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

std::string to_string(const DateTime& date_time) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", date_time.date.year,
                  date_time.date.month, date_time.date.day, date_time.hour, date_time.minute,
                  date_time.second);
    return buf;
}

Date today() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    Date date;
    date.year = local.tm_year + 1900;
    date.month = local.tm_mon + 1;
    date.day = local.tm_mday;
    return date;
}

} // namespace sportslog
