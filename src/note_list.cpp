// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "note_list.h"

#include <spdlog/spdlog.h>

namespace sportslog {

EntryListView<Note> NoteList::filter(const EntryFilter& filter) const {
    auto result = filter_entry_list<Note>(*this, filter, EntryType::NOTE,
                                          [](const Note&) { return true; });
    if (!result.is_pass_through()) {
        spdlog::debug("[NoteList] Filter matched {} of {} notes", result.size(), size());
    }
    return result;
}

} // namespace sportslog
