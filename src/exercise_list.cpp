// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "exercise_list.h"

#include "data_errors.h"

#include <spdlog/spdlog.h>

namespace sportslog {

void ExerciseList::update_sport_types(const SportTypeList& sport_types) {
    for (const auto& exercise : *this) {
        try {
            auto sport_type = sport_types.find_by_id(exercise->sport_type->id);
            if (!sport_type) {
                throw ReferenceNotFound(SportType::KIND, exercise->sport_type->id);
            }

            auto subtype = sport_type->sport_subtypes.find_by_id(exercise->sport_subtype->id);
            if (!subtype) {
                throw ReferenceNotFound(SportSubType::KIND, exercise->sport_subtype->id);
            }

            // Equipment is optional
            std::shared_ptr<Equipment> equipment;
            if (exercise->equipment) {
                equipment = sport_type->equipment.find_by_id(exercise->equipment->id);
                if (!equipment) {
                    throw ReferenceNotFound(Equipment::KIND, exercise->equipment->id);
                }
            }

            exercise->sport_type = std::move(sport_type);
            exercise->sport_subtype = std::move(subtype);
            exercise->equipment = std::move(equipment);
        } catch (const ReferenceNotFound& e) {
            spdlog::error("[ExerciseList] Cannot rebind exercise {}: {}", exercise->id, e.what());
            throw;
        }
    }

    spdlog::debug("[ExerciseList] Rebound {} exercises to {} sport types", size(),
                  sport_types.size());
}

EntryListView<Exercise> ExerciseList::filter(const EntryFilter& filter) const {
    auto result = filter_entry_list<Exercise>(*this, filter, EntryType::EXERCISE,
                                              [&filter](const Exercise& exercise) {
                                                  return matches_exercise_criteria(exercise,
                                                                                   filter);
                                              });

    if (result.is_pass_through()) {
        spdlog::trace("[ExerciseList] Filter targets {}, returning all exercises",
                      entry_type_to_string(filter.entry_type));
    } else {
        spdlog::debug("[ExerciseList] Filter matched {} of {} exercises", result.size(), size());
    }
    return result;
}

bool ExerciseList::matches_exercise_criteria(const Exercise& exercise, const EntryFilter& filter) {
    if (filter.sport_type_id && *filter.sport_type_id != exercise.sport_type->id) {
        return false;
    }

    if (filter.sport_subtype_id && *filter.sport_subtype_id != exercise.sport_subtype->id) {
        return false;
    }

    if (filter.intensity && *filter.intensity != exercise.intensity) {
        return false;
    }

    // Exercises without equipment never match an equipment filter
    if (filter.equipment_id &&
        (!exercise.equipment || *filter.equipment_id != exercise.equipment->id)) {
        return false;
    }

    return true;
}

} // namespace sportslog
