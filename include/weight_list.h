// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "entry.h"
#include "entry_filter.h"
#include "entry_list.h"

namespace sportslog {

/**
 * @brief All weight entries of the user
 */
class WeightList : public EntryList<Weight> {
  public:
    /**
     * @brief Get all weights within the filter's date range and matching its comment
     *
     * Passes this list through unchanged if the filter targets another entry type.
     *
     * @throws PatternSyntaxError for a malformed regular expression
     */
    [[nodiscard]] EntryListView<Weight> filter(const EntryFilter& filter) const;
};

} // namespace sportslog
