/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/checkpoint_system.hpp"

#include <algorithm>
#include <set>

#include "blockchain/consensus_records.hpp"
#include "blockchain/validator_registry.hpp"
#include "consensus/finality_gadget.hpp"
#include "consensus/signing.hpp"

namespace keel::consensus {

  CheckpointSystem::CheckpointSystem(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<ValidatorRegistry> validator_registry,
      qtils::SharedRef<FinalityGadget> finality_gadget,
      qtils::SharedRef<ConsensusRecords> records,
      const ConsensusConfig &config,
      Quorum quorum)
      : logger_{logging_system->getLogger("CheckpointSystem", "checkpoint")},
        validator_registry_{std::move(validator_registry)},
        finality_gadget_{std::move(finality_gadget)},
        records_{std::move(records)},
        interval_{config.checkpoint_interval},
        lookahead_{std::max(config.safety_window, config.checkpoint_interval)},
        quorum_{quorum} {}

  bool CheckpointSystem::isCheckpointHeight(Height height) const {
    return interval_ != 0 and height != 0 and height % interval_ == 0;
  }

  std::optional<Checkpoint> CheckpointSystem::at(Height height) const {
    return records_->checkpointAt(height);
  }

  bool CheckpointSystem::isSealed(Height height, const BlockHash &hash) const {
    auto sealed = records_->checkpointAt(height);
    return sealed and sealed->block_hash == hash;
  }

  outcome::result<void> CheckpointSystem::checkSealable(
      Height height, const BlockHash &hash) const {
    if (latest_ and height <= latest_->height) {
      return Error::BELOW_LATEST_CHECKPOINT;
    }
    if (auto finalized = finality_gadget_->finalizedAt(height);
        finalized and finalized->block_hash != hash) {
      return Error::CONFLICTS_WITH_FINALIZED;
    }
    if (finality_gadget_->conflictsWithFinality(hash)) {
      SL_WARN(logger_,
              "Checkpoint {} does not descend from finalized block",
              BlockIndexRef{height, hash});
      return Error::CONFLICTS_WITH_FINALIZED;
    }
    return outcome::success();
  }

  outcome::result<std::optional<Checkpoint>> CheckpointSystem::onBlock(
      const BlockHeader &header, const BlockHash &hash) {
    if (not isCheckpointHeight(header.height)
        or (latest_ and header.height <= latest_->height)) {
      return std::nullopt;
    }
    auto &candidate = candidates_[header.height][hash];
    candidate.state_root = header.state_root;
    SL_DEBUG(logger_,
             "Checkpoint candidate {}",
             BlockIndexRef{header.height, hash});
    return trySeal(header.height, hash);
  }

  outcome::result<std::optional<Checkpoint>> CheckpointSystem::onSignature(
      const CheckpointSignature &signature) {
    auto &message = signature.message;
    if (not isCheckpointHeight(message.height)) {
      return Error::NOT_CHECKPOINT_HEIGHT;
    }
    // Re-processing sealed checkpoint is a no-op
    if (isSealed(message.height, message.block_hash)) {
      return std::nullopt;
    }
    if (latest_ and message.height <= latest_->height) {
      return Error::BELOW_LATEST_CHECKPOINT;
    }
    if (message.height
        > finality_gadget_->latestFinalized().height + lookahead_) {
      SL_DEBUG(logger_,
               "Checkpoint signature of {:0x} for {} is too far ahead",
               signature.validator,
               BlockIndexRef{message.height, message.block_hash});
      return Error::TOO_FAR_AHEAD;
    }
    if (auto finalized = finality_gadget_->finalizedAt(message.height);
        finalized and finalized->block_hash != message.block_hash) {
      SL_WARN(logger_,
              "Checkpoint signature of {:0x} for {} conflicts with finalized "
              "block {:0x}",
              signature.validator,
              BlockIndexRef{message.height, message.block_hash},
              finalized->block_hash);
      return Error::CONFLICTS_WITH_FINALIZED;
    }
    if (not validator_registry_->validator(signature.validator)) {
      return Error::UNKNOWN_VALIDATOR;
    }
    if (not validator_registry_->isEligible(signature.validator)) {
      return Error::INELIGIBLE_SIGNER;
    }

    auto [signed_it, first] = signed_[message.height].try_emplace(
        signature.validator, message.block_hash);
    if (not first) {
      if (signed_it->second == message.block_hash) {
        return std::nullopt;
      }
      SL_WARN(logger_,
              "Validator {:0x} signed conflicting checkpoints at height {}: "
              "{:0x} and {:0x}",
              signature.validator,
              message.height,
              signed_it->second,
              message.block_hash);
      return Error::CONFLICTING_SIGNATURE;
    }

    auto &candidate = candidates_[message.height][message.block_hash];
    candidate.signatures.emplace(signature.validator, signature);
    candidate.power += validator_registry_->votingPower(signature.validator);
    SL_TRACE(logger_,
             "Checkpoint signature of {:0x} for {}, power {}",
             signature.validator,
             BlockIndexRef{message.height, message.block_hash},
             candidate.power);
    return trySeal(message.height, message.block_hash);
  }

  outcome::result<std::optional<Checkpoint>> CheckpointSystem::trySeal(
      Height height, const BlockHash &hash) {
    auto &candidate = candidates_.at(height).at(hash);
    // State root is known only once block itself is seen
    if (not candidate.state_root
        or not quorum_.reached(candidate.power,
                               validator_registry_->totalPower())) {
      return std::nullopt;
    }
    BOOST_OUTCOME_TRY(checkSealable(height, hash));

    Checkpoint checkpoint{
        .height = height,
        .block_hash = hash,
        .state_root = *candidate.state_root,
        .signatures = {},
        .power = candidate.power,
    };
    for (auto &[_, signature] : candidate.signatures) {
      checkpoint.signatures.emplace_back(signature);
    }
    BOOST_OUTCOME_TRY(record(checkpoint));
    return checkpoint;
  }

  outcome::result<void> CheckpointSystem::seal(const Checkpoint &checkpoint) {
    if (isSealed(checkpoint.height, checkpoint.block_hash)) {
      return outcome::success();
    }
    BOOST_OUTCOME_TRY(checkSealable(checkpoint.height, checkpoint.block_hash));
    if (not isCheckpointHeight(checkpoint.height)) {
      return Error::NOT_CHECKPOINT_HEIGHT;
    }
    if (not finality_gadget_->status(checkpoint.block_hash)) {
      return Error::UNKNOWN_BLOCK;
    }

    std::set<ValidatorId> signers;
    VotingPower power = 0;
    for (auto &signature : checkpoint.signatures) {
      if (signature.message.height != checkpoint.height
          or signature.message.block_hash != checkpoint.block_hash
          or not verifyCheckpointSignature(signature)) {
        return Error::INVALID_SIGNATURE;
      }
      if (not validator_registry_->isEligible(signature.validator)
          or not signers.emplace(signature.validator).second) {
        continue;
      }
      power += validator_registry_->votingPower(signature.validator);
    }
    if (not quorum_.reached(power, validator_registry_->totalPower())) {
      return Error::INSUFFICIENT_QUORUM;
    }

    auto sealed = checkpoint;
    sealed.power = power;
    return record(std::move(sealed));
  }

  outcome::result<void> CheckpointSystem::record(Checkpoint checkpoint) {
    // Finality first, a recorded checkpoint never contradicts it
    if (finality_gadget_->status(checkpoint.block_hash)
        != BlockStatus::Finalized) {
      BOOST_OUTCOME_TRY(finality_gadget_->finalize(
          checkpoint.block_hash, FinalizedBy::Checkpoint, checkpoint.power));
    }
    BOOST_OUTCOME_TRY(records_->putCheckpoint(checkpoint));
    SL_INFO(logger_,
            "Checkpoint {} sealed with power {} from {} signers",
            checkpoint,
            checkpoint.power,
            checkpoint.signatures.size());

    auto height = checkpoint.height;
    latest_ = std::move(checkpoint);
    candidates_.erase(candidates_.begin(), candidates_.upper_bound(height));
    signed_.erase(signed_.begin(), signed_.upper_bound(height));
    return outcome::success();
  }

}  // namespace keel::consensus
