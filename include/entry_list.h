// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "entry.h"
#include "entry_filter.h"
#include "id_object_list.h"

#include <algorithm>
#include <optional>
#include <utility>

/**
 * @file entry_list.h
 * @brief Date-ordered lists of calendar entries and filtered views on them
 */

namespace sportslog {

template <typename T> class EntryListView;

/**
 * @brief Entries ordered by date/time (ascending)
 *
 * Entries with the same date/time keep their insertion order.
 */
template <typename T> class EntryList : public IdObjectList<T> {
  public:
    using Ptr = typename IdObjectList<T>::Ptr;

    /**
     * @brief Add an entry, or replace the entry with the same ID
     *
     * The entry is (re)inserted at its date/time position.
     *
     * @throws std::invalid_argument for a null entry or an ID <= 0
     */
    void set(Ptr entry) override {
        this->validate(entry);
        auto existing = this->find_iterator(entry->id);
        if (existing != this->items_.end()) {
            this->items_.erase(existing);
        }

        auto pos = std::upper_bound(
            this->items_.begin(), this->items_.end(), entry->date_time,
            [](const DateTime& dt, const Ptr& item) { return dt < item->date_time; });
        const T* changed = entry.get();
        this->items_.insert(pos, std::move(entry));
        this->notify(changed);
    }

    /**
     * @brief Entries whose date lies within [start, end]
     */
    [[nodiscard]] EntryList entries_in_range(const Date& start, const Date& end) const {
        EntryList result;
        for (const auto& entry : this->items_) {
            const Date& date = entry->date_time.date;
            if (date >= start && date <= end) {
                result.items_.push_back(entry);
            }
        }
        return result;
    }

    /**
     * @brief Copy of this list holding copies of all entries, in the same order
     *
     * Hides IdObjectList::deep_copy() so the copy stays an EntryList.
     */
    [[nodiscard]] EntryList deep_copy() const {
        EntryList copy;
        copy.items_.reserve(this->items_.size());
        for (const auto& entry : this->items_) {
            copy.items_.push_back(std::make_shared<T>(*entry));
        }
        return copy;
    }

  private:
    /// Append without re-sorting; the caller walks a list that is already ordered
    void append_in_order(Ptr entry) {
        this->items_.push_back(std::move(entry));
    }

    template <typename U, typename Predicate>
    friend EntryListView<U> filter_entry_list(const EntryList<U>& source, const EntryFilter& filter,
                                              EntryType own_type, Predicate&& extra_criteria);
};

/**
 * @brief Result of filtering an entry list
 *
 * Either refers to the source list itself (filter targets another entry type)
 * or owns a new list aliasing the matching entries. list() gives access in
 * both cases; the source must outlive a pass-through view.
 */
template <typename T> class EntryListView {
  public:
    static EntryListView pass_through(const EntryList<T>& source) {
        EntryListView view;
        view.source_ = &source;
        return view;
    }

    static EntryListView owning(EntryList<T> list) {
        EntryListView view;
        view.owned_ = std::move(list);
        return view;
    }

    [[nodiscard]] const EntryList<T>& list() const {
        return owned_ ? *owned_ : *source_;
    }

    /// true if list() is the unfiltered source list
    [[nodiscard]] bool is_pass_through() const {
        return !owned_.has_value();
    }

    [[nodiscard]] size_t size() const {
        return list().size();
    }
    [[nodiscard]] bool empty() const {
        return list().empty();
    }
    [[nodiscard]] const typename EntryList<T>::Ptr& at(size_t index) const {
        return list().at(index);
    }
    [[nodiscard]] typename EntryList<T>::const_iterator begin() const {
        return list().begin();
    }
    [[nodiscard]] typename EntryList<T>::const_iterator end() const {
        return list().end();
    }

  private:
    EntryListView() = default;

    const EntryList<T>* source_ = nullptr;
    std::optional<EntryList<T>> owned_;
};

/**
 * @brief Apply @p filter to @p source
 *
 * Entries must pass the base date/comment check and @p extra_criteria. The
 * comment pattern is compiled before the first entry is examined.
 *
 * @param own_type Entry type stored in @p source; other types pass through
 * @throws PatternSyntaxError for a malformed regular expression
 */
template <typename T, typename Predicate>
EntryListView<T> filter_entry_list(const EntryList<T>& source, const EntryFilter& filter,
                                   EntryType own_type, Predicate&& extra_criteria) {
    if (filter.entry_type != own_type) {
        return EntryListView<T>::pass_through(source);
    }

    CommentMatcher comment_matcher(filter.comment_pattern, filter.comment_mode);

    EntryList<T> found;
    for (const auto& entry : source) {
        if (matches_base_criteria(*entry, filter, comment_matcher) && extra_criteria(*entry)) {
            found.append_in_order(entry);
        }
    }
    return EntryListView<T>::owning(std::move(found));
}

} // namespace sportslog
