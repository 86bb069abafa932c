/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace keel {

  /**
   * @brief Thread-safe wrapper for any object
   *
   * All access to the wrapped object goes through a functor executed under the
   * mutex: exclusive for mutation, shared for read-only inspection.
   *
   * @tparam T The type of object to wrap
   * @tparam M The mutex type to use for synchronization
   */
  template <typename T, typename M = std::shared_mutex>
  struct SafeObject {
    using Type = T;

    template <typename... Args>
    explicit SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    template <typename F>
    inline auto exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    template <typename F>
    inline auto sharedAccess(F &&f) const {
      std::shared_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    T &unsafeGet() {
      return t_;
    }

    const T &unsafeGet() const {
      return t_;
    }

   private:
    T t_;
    mutable M cs_;
  };

}  // namespace keel
