/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "types/vote.hpp"

namespace keel {

  /**
   * Distinct commit votes that reached quorum for one block.
   */
  struct QuorumCertificate {
    BlockHash block_hash;
    Height height = 0;
    Round round = 0;
    std::vector<SignedVote> votes;
    VotingPower power = 0;

    bool operator==(const QuorumCertificate &) const = default;

    bool hasVoter(const ValidatorId &validator) const {
      for (auto &vote : votes) {
        if (vote.data.validator == validator) {
          return true;
        }
      }
      return false;
    }
  };

  enum class FinalizedBy : uint8_t {
    Genesis,
    /// Own commit quorum
    Quorum,
    /// Finalized as ancestor of a block with quorum
    Descendant,
    /// Sealed checkpoint
    Checkpoint,
    /// Confirmation depth reached
    Depth,
  };

  /**
   * Finality record of one height.
   */
  struct FinalizedBlock {
    Height height = 0;
    BlockHash block_hash;
    StateRoot state_root;
    Round round = 0;
    FinalizedBy finalized_by = FinalizedBy::Quorum;
    /// Power of the quorum that caused finalization
    VotingPower power = 0;

    bool operator==(const FinalizedBlock &) const = default;
  };

}  // namespace keel
