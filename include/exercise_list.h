// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "entry.h"
#include "entry_filter.h"
#include "entry_list.h"
#include "sport_type.h"

namespace sportslog {

/**
 * @brief All exercises of the user
 *
 * Holds shared references to Exercise records owned by the persistence
 * layer. The calendar and list views display the result of filter().
 *
 * @note Not thread-safe: update_sport_types() mutates exercises in place
 * while filter() reads them.
 */
class ExerciseList : public EntryList<Exercise> {
  public:
    /**
     * @brief Rebind all exercises to a reloaded sport type list
     *
     * Editing reference data produces new SportType / SportSubType / Equipment
     * objects with the same IDs. Each exercise gets the new sport type with
     * its old sport type's ID, then the new subtype and (if set) equipment
     * with the old IDs from that new sport type.
     *
     * @param sport_types Complete reference data; every ID used by an
     *        exercise must be present
     * @throws ReferenceNotFound if an ID is missing. Exercises processed
     *         before the failing one are already rebound.
     */
    void update_sport_types(const SportTypeList& sport_types);

    /**
     * @brief Get all exercises fulfilling every criterion of @p filter
     *
     * If the filter does not target exercises the view refers to this list
     * itself. Otherwise it owns a new list in the same order as this one.
     *
     * @throws PatternSyntaxError for a malformed regular expression in REGEX
     *         comment mode (nothing is returned)
     */
    [[nodiscard]] EntryListView<Exercise> filter(const EntryFilter& filter) const;

  private:
    static bool matches_exercise_criteria(const Exercise& exercise, const EntryFilter& filter);
};

} // namespace sportslog
