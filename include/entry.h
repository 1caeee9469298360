// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "date_time.h"
#include "sport_type.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

/**
 * @file entry.h
 * @brief Calendar entries logged by the user: exercises, notes, weights
 *
 * Entries are created and destroyed by the persistence layer and shared with
 * the lists by shared_ptr. Filtered lists alias the same entry objects.
 */

namespace sportslog {

/**
 * @brief Perceived intensity of an exercise
 */
enum class IntensityType {
    MINIMUM,
    LOW,
    NORMAL,
    HIGH,
    MAXIMUM,
};

/**
 * @brief Get string name for intensity ("minimum", "low", ...)
 */
const char* intensity_to_string(IntensityType intensity);

/**
 * @brief Parse intensity name (case-insensitive)
 * @return Matching intensity, nullopt if not recognized
 */
std::optional<IntensityType> intensity_from_string(std::string_view str);

/**
 * @brief Common part of all calendar entries
 */
struct Entry {
    int id = 0;
    DateTime date_time;
    std::string comment;
};

struct Exercise : Entry {
    static constexpr const char* KIND = "Exercise";

    IntensityType intensity = IntensityType::NORMAL;

    /// Never null for a valid exercise
    std::shared_ptr<const SportType> sport_type;
    /// Never null, belongs to sport_type
    std::shared_ptr<const SportSubType> sport_subtype;
    /// Optional, belongs to sport_type when set
    std::shared_ptr<const Equipment> equipment;

    int duration_seconds = 0;
    double distance_km = 0.0;
    int avg_heart_rate = 0; ///< bpm, 0 = unknown
};

struct Note : Entry {
    static constexpr const char* KIND = "Note";
};

struct Weight : Entry {
    static constexpr const char* KIND = "Weight";

    double value_kg = 0.0;
};

} // namespace sportslog
