/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/slashing_manager.hpp"

#include <algorithm>

#include "blockchain/consensus_records.hpp"
#include "blockchain/validator_registry.hpp"
#include "consensus/signing.hpp"
#include "types/constants.hpp"

namespace keel::consensus {

  SlashingManager::SlashingManager(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<ValidatorRegistry> validator_registry,
      qtils::SharedRef<ConsensusRecords> records,
      const ConsensusConfig &config)
      : logger_{logging_system->getLogger("SlashingManager", "slashing")},
        validator_registry_{std::move(validator_registry)},
        records_{std::move(records)},
        params_{config.slashing} {}

  bool SlashingManager::verify(const SlashingEvidence &evidence) const {
    if (not evidence.isSigned()) {
      return evidence.consecutive_missed >= params_.unavailability_threshold;
    }
    if (not evidence.first or not evidence.second) {
      return false;
    }
    auto &first = evidence.first->data;
    auto &second = evidence.second->data;
    if (first.validator != evidence.offender
        or second.validator != evidence.offender
        or first.height != second.height
        or first.block_hash == second.block_hash) {
      return false;
    }
    switch (evidence.offense) {
      case Offense::DoubleSign:
        if (first.round != second.round) {
          return false;
        }
        break;
      case Offense::LongRangeEquivocation:
        // First vote is the one in finality certificate
        if (first.phase() != VotePhase::Commit
            or second.phase() != VotePhase::Commit) {
          return false;
        }
        break;
      case Offense::Unavailability:
        return false;
    }
    return verifyVote(*evidence.first) and verifyVote(*evidence.second);
  }

  Amount SlashingManager::penaltyFor(const SlashingEvidence &evidence,
                                     Amount stake) const {
    uint64_t bps = 0;
    switch (evidence.offense) {
      case Offense::DoubleSign:
      case Offense::LongRangeEquivocation:
        bps = params_.double_sign_penalty_bps;
        break;
      case Offense::Unavailability:
        bps = std::min(
            evidence.consecutive_missed * params_.unavailability_per_miss_bps,
            params_.unavailability_cap_bps);
        break;
    }
    bps = std::min<uint64_t>(bps, BPS_DENOMINATOR);
    return stake / BPS_DENOMINATOR * bps
         + stake % BPS_DENOMINATOR * bps / BPS_DENOMINATOR;
  }

  outcome::result<SlashingOutcome> SlashingManager::processEvidence(
      const SlashingEvidence &evidence, Height current_height) {
    if (not verify(evidence)) {
      SL_WARN(logger_,
              "Invalid {} evidence against {:0x} rejected",
              evidence.offense,
              evidence.offender);
      return Error::INVALID_EVIDENCE;
    }

    auto evidence_hash = evidence.hash();
    if (records_->evidence(evidence_hash)) {
      SL_DEBUG(logger_, "Evidence {:0x} already processed", evidence_hash);
      return SlashingOutcome::AlreadyProcessed;
    }

    if (evidence.height + params_.evidence_expiry_heights < current_height) {
      SL_INFO(logger_,
              "{} evidence against {:0x} at height {} expired",
              evidence.offense,
              evidence.offender,
              evidence.height);
      return SlashingOutcome::Expired;
    }

    auto validator = validator_registry_->validator(evidence.offender);
    if (not validator) {
      return ValidatorRegistry::Error::UNKNOWN_VALIDATOR;
    }
    auto penalty = penaltyFor(evidence, validator->stake);
    auto stake_after = validator->stake - std::min(penalty, validator->stake);
    auto severity = evidence.isSigned() ? SlashSeverity::Severe
                                        : SlashSeverity::Minor;

    // Audit record goes first, stake is never deducted without it
    BOOST_OUTCOME_TRY(records_->putEvidence(SlashingRecord{
        .evidence_hash = evidence_hash,
        .evidence = evidence,
        .penalty = penalty,
        .stake_after = stake_after,
        .processed_at = current_height,
    }));
    BOOST_OUTCOME_TRY(validator_registry_->applySlash(
        evidence.offender, penalty, severity));

    SL_WARN(logger_,
            "Slashed {:0x} for {} at height {}: penalty {}, stake left {}",
            evidence.offender,
            evidence.offense,
            evidence.height,
            penalty,
            stake_after);
    return SlashingOutcome::Slashed;
  }

}  // namespace keel::consensus
