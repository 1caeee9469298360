// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "id_object_list.h"

#include <string>

/**
 * @file sport_type.h
 * @brief Reference data used to classify exercises
 *
 * A SportType (e.g. "Cycling") owns its subtypes ("Road", "MTB") and the
 * equipment used for it ("Road bike"). Subtype and equipment IDs are only
 * unique within their sport type.
 *
 * The reference data editor works on a deep copy and hands the whole new
 * SportTypeList back when the user saves, so object identity changes while
 * IDs are preserved. ExerciseList::update_sport_types() rebinds the exercises.
 */

namespace sportslog {

struct SportSubType {
    static constexpr const char* KIND = "SportSubType";

    int id = 0;
    std::string name;
};

struct Equipment {
    static constexpr const char* KIND = "Equipment";

    int id = 0;
    std::string name;
    bool not_in_use = false; ///< Retired, hidden when logging new exercises
};

struct SportType {
    static constexpr const char* KIND = "SportType";

    int id = 0;
    std::string name;
    bool record_distance = true; ///< false for sports without distance (e.g. yoga)

    IdObjectList<SportSubType> sport_subtypes;
    IdObjectList<Equipment> equipment;

    SportType() = default;

    /// Copies deep-copy subtypes and equipment (same IDs, new objects)
    SportType(const SportType& other);
    SportType& operator=(const SportType& other);
    SportType(SportType&&) = default;
    SportType& operator=(SportType&&) = default;
    ~SportType() = default;
};

using SportTypeList = IdObjectList<SportType>;

} // namespace sportslog
