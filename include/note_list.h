// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "entry.h"
#include "entry_filter.h"
#include "entry_list.h"

namespace sportslog {

/**
 * @brief Free-text diary notes shown in the calendar next to exercises
 */
class NoteList : public EntryList<Note> {
  public:
    /// Date range and comment criteria only; see ExerciseList::filter()
    [[nodiscard]] EntryListView<Note> filter(const EntryFilter& filter) const;
};

} // namespace sportslog
