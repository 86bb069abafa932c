/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "blockchain/stake_treasury.hpp"

namespace keel {
  class StakeTreasuryMock : public StakeTreasury {
   public:
    MOCK_METHOD(std::vector<ValidatorId>, stakeholders, (), (const, override));
    MOCK_METHOD(Amount,
                currentStake,
                (const ValidatorId &),
                (const, override));
    MOCK_METHOD(void, applyReward, (const RewardMap &), (override));
    MOCK_METHOD(void,
                applyPenalty,
                (const ValidatorId &, Amount),
                (override));
  };
}  // namespace keel
