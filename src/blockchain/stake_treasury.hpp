/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <vector>

#include "types/validator.hpp"

namespace keel {

  using RewardMap = std::map<ValidatorId, Amount>;

  /**
   * Balance keeper outside of consensus core.
   * Read at epoch rotation; the only state mutated on behalf of consensus is
   * crediting rewards and debiting penalties.
   */
  class StakeTreasury {
   public:
    virtual ~StakeTreasury() = default;

    /// Every account that may become validator
    [[nodiscard]] virtual std::vector<ValidatorId> stakeholders() const = 0;

    [[nodiscard]] virtual Amount currentStake(
        const ValidatorId &validator) const = 0;

    virtual void applyReward(const RewardMap &rewards) = 0;

    virtual void applyPenalty(const ValidatorId &validator, Amount amount) = 0;
  };

}  // namespace keel
