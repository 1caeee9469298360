// Copyright 2026 SportsLog
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "data_errors.h"

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file id_object_list.h
 * @brief Ordered list of objects keyed by a positive integer ID
 *
 * Base container for reference data (sport types, subtypes, equipment) and
 * for the entry lists. Items are held by shared_ptr: copying a list copies
 * references, not objects. Use deep_copy() to get a new object graph with the
 * same IDs.
 *
 * Requirements on T:
 * - public `int id` member
 * - `static constexpr const char* KIND` naming the type for error messages
 *
 * @note Not thread-safe. Mutations and reads must happen on the same thread.
 */

namespace sportslog {

template <typename T> class IdObjectList {
  public:
    using Ptr = std::shared_ptr<T>;
    using const_iterator = typename std::vector<Ptr>::const_iterator;

    /**
     * @brief Called after the list changed
     * @param changed Item that was added/replaced/removed, nullptr after clear()
     */
    using ChangeListener = std::function<void(const T* changed)>;

    IdObjectList() = default;
    virtual ~IdObjectList() = default;

    // Listeners stay with the original list
    IdObjectList(const IdObjectList& other) : items_(other.items_) {}
    IdObjectList& operator=(const IdObjectList& other) {
        items_ = other.items_;
        return *this;
    }
    IdObjectList(IdObjectList&&) = default;
    IdObjectList& operator=(IdObjectList&&) = default;

    /**
     * @brief Add an item, or replace the item with the same ID in place
     * @throws std::invalid_argument for a null item or an ID <= 0
     */
    virtual void set(Ptr item) {
        validate(item);
        auto it = find_iterator(item->id);
        const T* changed = item.get();
        if (it != items_.end()) {
            *it = std::move(item);
        } else {
            items_.push_back(std::move(item));
        }
        notify(changed);
    }

    /**
     * @brief Get item by ID
     * @throws ReferenceNotFound when no item has this ID
     */
    [[nodiscard]] T& get_by_id(int id) const {
        auto it = find_iterator(id);
        if (it == items_.end()) {
            throw ReferenceNotFound(T::KIND, id);
        }
        return **it;
    }

    /**
     * @brief Get shared reference to item by ID, nullptr when absent
     */
    [[nodiscard]] Ptr find_by_id(int id) const {
        auto it = find_iterator(id);
        return it != items_.end() ? *it : nullptr;
    }

    [[nodiscard]] bool contains_id(int id) const {
        return find_iterator(id) != items_.end();
    }

    /**
     * @brief Remove item by ID
     * @return true if an item was removed
     */
    bool remove_by_id(int id) {
        auto it = find_iterator(id);
        if (it == items_.end()) {
            return false;
        }
        Ptr removed = *it;
        items_.erase(it);
        notify(removed.get());
        return true;
    }

    void clear() {
        items_.clear();
        notify(nullptr);
    }

    /// @throws std::out_of_range for an invalid index
    [[nodiscard]] const Ptr& at(size_t index) const {
        return items_.at(index);
    }

    [[nodiscard]] size_t size() const {
        return items_.size();
    }
    [[nodiscard]] bool empty() const {
        return items_.empty();
    }

    [[nodiscard]] const_iterator begin() const {
        return items_.begin();
    }
    [[nodiscard]] const_iterator end() const {
        return items_.end();
    }

    /**
     * @brief Smallest positive ID not used by any item
     */
    [[nodiscard]] int new_id() const {
        int candidate = 1;
        while (contains_id(candidate)) {
            ++candidate;
        }
        return candidate;
    }

    /**
     * @brief Copy of this list holding copies of all items (same IDs, new objects)
     */
    [[nodiscard]] IdObjectList deep_copy() const {
        IdObjectList copy;
        copy.items_.reserve(items_.size());
        for (const auto& item : items_) {
            copy.items_.push_back(std::make_shared<T>(*item));
        }
        return copy;
    }

    /**
     * @brief Register a change listener
     * @return Handle for remove_listener()
     */
    int add_listener(ChangeListener listener) {
        int handle = next_listener_handle_++;
        listeners_.emplace_back(handle, std::move(listener));
        return handle;
    }

    void remove_listener(int handle) {
        listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                        [handle](const auto& l) { return l.first == handle; }),
                         listeners_.end());
    }

  protected:
    std::vector<Ptr> items_;

    void validate(const Ptr& item) const {
        if (!item) {
            throw std::invalid_argument(std::string("null ") + T::KIND);
        }
        if (item->id <= 0) {
            throw std::invalid_argument(std::string(T::KIND) + " ID must be positive, got " +
                                        std::to_string(item->id));
        }
    }

    typename std::vector<Ptr>::const_iterator find_iterator(int id) const {
        return std::find_if(items_.begin(), items_.end(),
                            [id](const Ptr& item) { return item->id == id; });
    }

    typename std::vector<Ptr>::iterator find_iterator(int id) {
        return std::find_if(items_.begin(), items_.end(),
                            [id](const Ptr& item) { return item->id == id; });
    }

    // Listeners may add or remove listeners; those changes apply from the next notification
    void notify(const T* changed) const {
        const auto snapshot = listeners_;
        for (const auto& [handle, listener] : snapshot) {
            (void)handle;
            listener(changed);
        }
    }

  private:
    std::vector<std::pair<int, ChangeListener>> listeners_;
    int next_listener_handle_ = 1;
};

} // namespace sportslog
