/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

namespace keel {

  /**
   * Bounded FIFO buffer.
   * Pushing into a full buffer evicts the oldest element and returns it, so
   * the caller can account for what was dropped.
   */
  template <typename T>
  class BoundedFifo {
   public:
    explicit BoundedFifo(size_t capacity) : capacity_{capacity} {}

    std::optional<T> push(T value) {
      std::optional<T> evicted;
      if (capacity_ == 0) {
        return value;
      }
      if (items_.size() >= capacity_) {
        evicted.emplace(std::move(items_.front()));
        items_.pop_front();
      }
      items_.emplace_back(std::move(value));
      return evicted;
    }

    /// Removes and returns all elements matching predicate, oldest first
    template <typename Pred>
    std::deque<T> extract(Pred &&pred) {
      std::deque<T> taken;
      for (auto it = items_.begin(); it != items_.end();) {
        if (pred(*it)) {
          taken.emplace_back(std::move(*it));
          it = items_.erase(it);
        } else {
          ++it;
        }
      }
      return taken;
    }

    template <typename Pred>
    bool any(Pred &&pred) const {
      for (auto &item : items_) {
        if (pred(item)) {
          return true;
        }
      }
      return false;
    }

    /// Oldest first
    const std::deque<T> &items() const {
      return items_;
    }

    size_t size() const {
      return items_.size();
    }

    bool empty() const {
      return items_.empty();
    }

    size_t capacity() const {
      return capacity_;
    }

   private:
    size_t capacity_;
    std::deque<T> items_;
  };

}  // namespace keel
