/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <shared_mutex>

#include "blockchain/stake_treasury.hpp"

namespace keel {

  class InMemoryStakeTreasury : public StakeTreasury {
   public:
    InMemoryStakeTreasury() = default;
    explicit InMemoryStakeTreasury(std::map<ValidatorId, Amount> stakes);

    void deposit(const ValidatorId &validator, Amount amount);

    // StakeTreasury
    [[nodiscard]] std::vector<ValidatorId> stakeholders() const override;
    [[nodiscard]] Amount currentStake(
        const ValidatorId &validator) const override;
    void applyReward(const RewardMap &rewards) override;
    void applyPenalty(const ValidatorId &validator, Amount amount) override;

    /// Sum of all penalties debited so far
    [[nodiscard]] Amount burned() const;

   private:
    mutable std::shared_mutex mutex_;
    std::map<ValidatorId, Amount> stakes_;
    Amount burned_ = 0;
  };

}  // namespace keel
