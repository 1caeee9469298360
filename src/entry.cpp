// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "entry.h"

#include <algorithm>
#include <cctype>

namespace sportslog {

const char* intensity_to_string(IntensityType intensity) {
    switch (intensity) {
    case IntensityType::MINIMUM:
        return "minimum";
    case IntensityType::LOW:
        return "low";
    case IntensityType::NORMAL:
        return "normal";
    case IntensityType::HIGH:
        return "high";
    case IntensityType::MAXIMUM:
        return "maximum";
    }
    return "normal";
}

std::optional<IntensityType> intensity_from_string(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "minimum") {
        return IntensityType::MINIMUM;
    }
    if (lower == "low") {
        return IntensityType::LOW;
    }
    if (lower == "normal") {
        return IntensityType::NORMAL;
    }
    if (lower == "high") {
        return IntensityType::HIGH;
    }
    if (lower == "maximum") {
        return IntensityType::MAXIMUM;
    }
    return std::nullopt;
}

} // namespace sportslog
