/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/reward_calculator.hpp"

#include <algorithm>
#include <set>

#include "types/constants.hpp"

namespace keel::consensus {

  RewardCalculator::RewardCalculator(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      const RewardParams &params)
      : logger_{logging_system->getLogger("RewardCalculator", "rewards")},
        params_{params} {}

  RewardMap RewardCalculator::calculate(
      const BlockHeader &block,
      const std::vector<SignedVote> &votes,
      const ValidatorSetSnapshot &snapshot) const {
    RewardMap rewards;
    auto proposer_share = std::min(params_.proposer_share, params_.block_reward);
    auto participation_share = params_.block_reward - proposer_share;
    rewards[block.proposer] = proposer_share;

    std::set<ValidatorId> voters;
    VotingPower voters_power = 0;
    for (auto &vote : votes) {
      auto &voter = vote.data.validator;
      if (not snapshot.isActive(voter) or voters.contains(voter)) {
        continue;
      }
      voters.emplace(voter);
      voters_power += snapshot.powerOf(voter);
    }
    if (voters.empty()) {
      SL_DEBUG(logger_,
               "No voters for {}, proposer reward {}",
               block,
               proposer_share);
      return rewards;
    }

    if (snapshot.total_power > 0
        and voters_power * BPS_DENOMINATOR
                < snapshot.total_power * params_.low_participation_bps) {
      auto boost = participation_share * params_.proposer_boost_bps
                 / BPS_DENOMINATOR;
      rewards[block.proposer] += boost;
      participation_share -= boost;
      SL_DEBUG(logger_,
               "Low participation {}/{} in {}, proposer boost {}",
               voters_power,
               snapshot.total_power,
               block,
               boost);
    }

    auto per_voter = participation_share / voters.size();
    for (auto &voter : voters) {
      rewards[voter] += per_voter;
    }
    rewards[block.proposer] += participation_share % voters.size();
    return rewards;
  }

}  // namespace keel::consensus
