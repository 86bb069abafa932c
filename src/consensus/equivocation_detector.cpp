/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/equivocation_detector.hpp"

namespace keel::consensus {

  EquivocationDetector::EquivocationDetector(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      const ConsensusConfig &config)
      : logger_{logging_system->getLogger("EquivocationDetector", "slashing")},
        window_{config.slashing.recent_vote_window} {}

  std::optional<SlashingEvidence> EquivocationDetector::observe(
      const SignedVote &vote, Height reference) {
    auto &data = vote.data;

    auto lower = reference > window_ ? reference - window_ : 0;
    pruneBelow(lower);
    if (data.height < lower or data.height > reference + window_) {
      SL_TRACE(logger_,
               "Vote {} is outside of detection window around height {}",
               data,
               reference);
      return std::nullopt;
    }

    auto &votes = recent_[data.validator];
    auto [it, inserted] = votes.try_emplace(VoteKey{data.height, data.round},
                                            vote);
    if (not inserted and it->second.data.block_hash != data.block_hash) {
      SL_WARN(logger_,
              "Double-sign by {:0x} at height {} round {}: {:0x} and {:0x}",
              data.validator,
              data.height,
              data.round,
              it->second.data.block_hash,
              data.block_hash);
      return SlashingEvidence{
          .offense = Offense::DoubleSign,
          .offender = data.validator,
          .height = data.height,
          .round = data.round,
          .first = it->second,
          .second = vote,
      };
    }
    return std::nullopt;
  }

  void EquivocationDetector::pruneBelow(Height height) {
    if (height <= pruned_below_) {
      return;
    }
    pruned_below_ = height;
    for (auto it = recent_.begin(); it != recent_.end();) {
      auto &votes = it->second;
      votes.erase(votes.begin(), votes.lower_bound(VoteKey{height, 0}));
      it = votes.empty() ? recent_.erase(it) : std::next(it);
    }
  }

  std::optional<SlashingEvidence> EquivocationDetector::observeAgainstFinalized(
      const SignedVote &vote, const QuorumCertificate &qc) const {
    auto &data = vote.data;
    if (data.phase() != VotePhase::Commit or data.height != qc.height
        or data.block_hash == qc.block_hash) {
      return std::nullopt;
    }
    for (auto &certified : qc.votes) {
      if (certified.data.validator != data.validator) {
        continue;
      }
      SL_WARN(logger_,
              "Long-range equivocation by {:0x}: voted {:0x} at finalized "
              "height {}",
              data.validator,
              data.block_hash,
              data.height);
      return SlashingEvidence{
          .offense = Offense::LongRangeEquivocation,
          .offender = data.validator,
          .height = data.height,
          .round = data.round,
          .first = certified,
          .second = vote,
      };
    }
    return std::nullopt;
  }

  SlashingEvidence EquivocationDetector::unavailability(
      const ValidatorId &validator,
      Epoch epoch,
      Height height,
      uint64_t consecutive_missed) const {
    SL_DEBUG(logger_,
             "Unavailability of {:0x} in epoch {}: {} consecutive misses",
             validator,
             epoch,
             consecutive_missed);
    return SlashingEvidence{
        .offense = Offense::Unavailability,
        .offender = validator,
        .height = height,
        .epoch = epoch,
        .consecutive_missed = consecutive_missed,
    };
  }

  size_t EquivocationDetector::trackedVotes() const {
    size_t count = 0;
    for (auto &[_, votes] : recent_) {
      count += votes.size();
    }
    return count;
  }

}  // namespace keel::consensus
