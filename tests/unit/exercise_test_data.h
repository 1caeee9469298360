// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "entry.h"
#include "sport_type.h"

#include <memory>
#include <string>

/**
 * @file exercise_test_data.h
 * @brief Reference data and exercises shared by the list tests
 *
 * Sport types:
 * - 1 Cycling: subtypes 1 Road, 2 MTB; equipment 1 Road bike, 2 Gravel bike
 * - 2 Running: subtypes 1 Road, 2 Trail; equipment 1 Shoes A
 */

namespace sportslog::test {

inline std::shared_ptr<SportType> make_sport_type(int id, const std::string& name) {
    auto sport_type = std::make_shared<SportType>();
    sport_type->id = id;
    sport_type->name = name;
    return sport_type;
}

inline void add_subtype(SportType& sport_type, int id, const std::string& name) {
    auto subtype = std::make_shared<SportSubType>();
    subtype->id = id;
    subtype->name = name;
    sport_type.sport_subtypes.set(subtype);
}

inline void add_equipment(SportType& sport_type, int id, const std::string& name) {
    auto equipment = std::make_shared<Equipment>();
    equipment->id = id;
    equipment->name = name;
    sport_type.equipment.set(equipment);
}

inline SportTypeList make_sport_types() {
    SportTypeList list;

    auto cycling = make_sport_type(1, "Cycling");
    add_subtype(*cycling, 1, "Road");
    add_subtype(*cycling, 2, "MTB");
    add_equipment(*cycling, 1, "Road bike");
    add_equipment(*cycling, 2, "Gravel bike");
    list.set(cycling);

    auto running = make_sport_type(2, "Running");
    add_subtype(*running, 1, "Road");
    add_subtype(*running, 2, "Trail");
    add_equipment(*running, 1, "Shoes A");
    list.set(running);

    return list;
}

/**
 * @brief Create an exercise referring into @p sport_types
 * @param equipment_id 0 for no equipment
 */
inline std::shared_ptr<Exercise>
make_exercise(const SportTypeList& sport_types, int id, const std::string& date_time,
              int sport_type_id, int subtype_id, int equipment_id,
              IntensityType intensity = IntensityType::NORMAL, const std::string& comment = "") {
    auto exercise = std::make_shared<Exercise>();
    exercise->id = id;
    exercise->date_time = *parse_date_time(date_time);
    exercise->comment = comment;
    exercise->intensity = intensity;

    auto sport_type = sport_types.find_by_id(sport_type_id);
    exercise->sport_type = sport_type;
    exercise->sport_subtype = sport_type->sport_subtypes.find_by_id(subtype_id);
    if (equipment_id > 0) {
        exercise->equipment = sport_type->equipment.find_by_id(equipment_id);
    }
    return exercise;
}

} // namespace sportslog::test
