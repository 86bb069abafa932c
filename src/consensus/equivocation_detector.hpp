/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <utility>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/config.hpp"
#include "types/quorum_certificate.hpp"
#include "types/slashing_evidence.hpp"

namespace keel::consensus {

  /**
   * Watches the vote stream for conflicting signed votes.
   * Keeps per validator the votes within `recent_vote_window` heights around
   * the local reference height, keyed by (height, round). Reference is
   * supplied by the caller, so votes of a validator never move its window.
   */
  class EquivocationDetector {
   public:
    EquivocationDetector(qtils::SharedRef<log::LoggingSystem> logging_system,
                         const ConsensusConfig &config);

    /**
     * Second vote for same (height, round) and another block is double-sign
     * @param vote to check and remember
     * @param reference local chain height, votes farther than window from it
     * are not tracked
     */
    std::optional<SlashingEvidence> observe(const SignedVote &vote,
                                            Height reference);

    /**
     * Commit vote at finalized height for another block by validator whose
     * commit vote is in the certificate. Prepare votes for other blocks are
     * legal before the validator locks on the certified one.
     */
    std::optional<SlashingEvidence> observeAgainstFinalized(
        const SignedVote &vote, const QuorumCertificate &qc) const;

    SlashingEvidence unavailability(const ValidatorId &validator,
                                    Epoch epoch,
                                    Height height,
                                    uint64_t consecutive_missed) const;

    size_t trackedVotes() const;

   private:
    using VoteKey = std::pair<Height, Round>;

    void pruneBelow(Height height);

    log::Logger logger_;
    Height window_;
    Height pruned_below_ = 0;
    std::map<ValidatorId, std::map<VoteKey, SignedVote>> recent_;
  };

}  // namespace keel::consensus
