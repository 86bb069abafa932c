/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <span>
#include <vector>

#include "crypto/hash_types.hpp"
#include "types/validator.hpp"

namespace keel {

  /**
   * Frozen validator set of one epoch.
   * Active validators come first in descending stake order (ties by public
   * key), queued validators follow. Never mutated after rotation.
   */
  struct ValidatorSetSnapshot {
    Epoch epoch = 0;
    std::vector<Validator> validators;
    size_t active_count = 0;
    VotingPower total_power = 0;
    Hash256 seed;

    std::span<const Validator> active() const {
      return std::span(validators).first(active_count);
    }

    std::optional<size_t> indexOf(const ValidatorId &id) const {
      for (size_t i = 0; i < validators.size(); ++i) {
        if (validators[i].id == id) {
          return i;
        }
      }
      return std::nullopt;
    }

    const Validator *find(const ValidatorId &id) const {
      auto index = indexOf(id);
      return index ? &validators[*index] : nullptr;
    }

    bool isActive(const ValidatorId &id) const {
      auto index = indexOf(id);
      return index and *index < active_count;
    }

    VotingPower powerOf(const ValidatorId &id) const {
      auto index = indexOf(id);
      if (not index or *index >= active_count) {
        return 0;
      }
      return validators[*index].voting_power;
    }
  };

  /// Changes of active set produced by rotation
  struct SetDelta {
    Epoch epoch = 0;
    std::vector<ValidatorId> added;
    std::vector<ValidatorId> removed;
    std::vector<ValidatorId> power_changed;

    bool empty() const {
      return added.empty() and removed.empty() and power_changed.empty();
    }
  };

}  // namespace keel
