// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sport_type.h"

namespace sportslog {

SportType::SportType(const SportType& other)
    : id(other.id), name(other.name), record_distance(other.record_distance),
      sport_subtypes(other.sport_subtypes.deep_copy()), equipment(other.equipment.deep_copy()) {}

SportType& SportType::operator=(const SportType& other) {
    if (this != &other) {
        id = other.id;
        name = other.name;
        record_distance = other.record_distance;
        sport_subtypes = other.sport_subtypes.deep_copy();
        equipment = other.equipment.deep_copy();
    }
    return *this;
}

} // namespace sportslog
