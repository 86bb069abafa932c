/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>

#include "types/slot.hpp"

namespace keel {

  enum class LeaderPolicy : uint8_t {
    /// (slot + attempt) mod n over active validators
    RoundRobin,
    /// Stake-proportional draw seeded by epoch randomness
    StakeWeighted,
  };

  /// Heaviest observed subtree
  struct GhostRule {};
  /// Greatest height
  struct LongestChainRule {};
  using ForkChoiceStrategy = std::variant<GhostRule, LongestChainRule>;

  /// Two-phase stake-weighted voting
  struct BftFinality {};
  /// Block is final once it is buried `depth` heights below head
  struct ConfirmationDepthFinality {
    uint64_t depth = 32;
  };
  using FinalityMode = std::variant<BftFinality, ConfirmationDepthFinality>;

  struct QuorumThreshold {
    uint64_t numerator = 2;
    uint64_t denominator = 3;
  };

  struct SlashingParams {
    uint64_t double_sign_penalty_bps = 5000;
    uint64_t unavailability_per_miss_bps = 100;
    uint64_t unavailability_cap_bps = 1000;
    /// Consecutive misses after which unavailability is reported
    uint64_t unavailability_threshold = 8;
    Height evidence_expiry_heights = 4096;
    /// Heights of votes kept per validator by detector
    Height recent_vote_window = 128;
  };

  struct RewardParams {
    Amount block_reward = 100;
    Amount proposer_share = 20;
    uint64_t low_participation_bps = 6667;
    uint64_t proposer_boost_bps = 2500;
  };

  /**
   * Protocol constants. Fixed at genesis, equal on every node.
   */
  struct ConsensusConfig {
    Slot slots_per_epoch = 32;
    uint64_t slot_duration_ms = 4000;

    size_t max_validators = 100;
    Amount min_stake = 1;
    Amount stake_per_power_unit = 1;

    QuorumThreshold quorum{};

    LeaderPolicy leader_policy = LeaderPolicy::RoundRobin;
    size_t backup_count = 3;
    uint64_t leader_timeout_ms = 1000;

    ForkChoiceStrategy fork_choice = GhostRule{};
    FinalityMode finality = BftFinality{};
    Height safety_window = 16;

    size_t orphan_buffer_limit = 256;
    Slot orphan_timeout_slots = 8;

    size_t vote_buffer_limit = 4096;
    Height vote_buffer_expiry_heights = 64;

    Height checkpoint_interval = 10;

    SlashingParams slashing{};
    RewardParams rewards{};

    Epoch epochOf(Slot slot) const {
      return slot / slots_per_epoch;
    }

    Slot firstSlotOf(Epoch epoch) const {
      return epoch * slots_per_epoch;
    }
  };

}  // namespace keel
