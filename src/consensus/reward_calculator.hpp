/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/shared_ref.hpp>

#include "blockchain/stake_treasury.hpp"
#include "log/logger.hpp"
#include "types/block.hpp"
#include "types/config.hpp"
#include "types/validator_set.hpp"
#include "types/vote.hpp"

namespace keel::consensus {

  /**
   * Splits block reward between proposer and voters of finalized block.
   *
   * Proposer takes fixed share, the rest is split equally between distinct
   * active voters. On low participation part of voters' share moves to the
   * proposer, as does the remainder of integer division.
   */
  class RewardCalculator {
   public:
    RewardCalculator(qtils::SharedRef<log::LoggingSystem> logging_system,
                     const RewardParams &params);

    [[nodiscard]] RewardMap calculate(
        const BlockHeader &block,
        const std::vector<SignedVote> &votes,
        const ValidatorSetSnapshot &snapshot) const;

   private:
    log::Logger logger_;
    RewardParams params_;
  };

}  // namespace keel::consensus
