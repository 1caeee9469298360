// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#include "weight_list.h"

#include <spdlog/spdlog.h>

namespace sportslog {

EntryListView<Weight> WeightList::filter(const EntryFilter& filter) const {
    auto result = filter_entry_list<Weight>(*this, filter, EntryType::WEIGHT,
                                            [](const Weight&) { return true; });
    if (!result.is_pass_through()) {
        spdlog::debug("[WeightList] Filter matched {} of {} weights", result.size(), size());
    }
    return result;
}

} // namespace sportslog
