/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/quorum.hpp"
#include "log/logger.hpp"
#include "types/block.hpp"
#include "types/checkpoint.hpp"
#include "types/config.hpp"

namespace keel {
  class ConsensusRecords;
  class ValidatorRegistry;
}  // namespace keel

namespace keel::consensus {
  class FinalityGadget;
}  // namespace keel::consensus

namespace keel::consensus {

  /**
   * Periodic supermajority-signed finality anchors.
   *
   * Every `checkpoint_interval` heights validators sign
   * `CheckpointMessage{height, block_hash}`. Once signers reach the same
   * quorum as finality voting the checkpoint is sealed, its block finalized
   * and the checkpoint recorded. Sealed heights strictly increase, a sealed
   * checkpoint seen again is a no-op.
   *
   * Signatures are accepted up to `max(safety_window, checkpoint_interval)`
   * heights above the finalized height, one per signer and height.
   */
  class CheckpointSystem {
   public:
    enum class Error {
      BELOW_LATEST_CHECKPOINT = 1,
      CONFLICTS_WITH_FINALIZED,
      NOT_CHECKPOINT_HEIGHT,
      UNKNOWN_VALIDATOR,
      INELIGIBLE_SIGNER,
      INVALID_SIGNATURE,
      INSUFFICIENT_QUORUM,
      UNKNOWN_BLOCK,
      TOO_FAR_AHEAD,
      CONFLICTING_SIGNATURE,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::BELOW_LATEST_CHECKPOINT:
          return "Checkpoint height is not above latest sealed checkpoint";
        case E::CONFLICTS_WITH_FINALIZED:
          return "Checkpoint conflicts with finalized block";
        case E::NOT_CHECKPOINT_HEIGHT:
          return "Height is not a checkpoint height";
        case E::UNKNOWN_VALIDATOR:
          return "Checkpoint signature from unknown validator";
        case E::INELIGIBLE_SIGNER:
          return "Checkpoint signature from ineligible validator";
        case E::INVALID_SIGNATURE:
          return "Invalid checkpoint signature";
        case E::INSUFFICIENT_QUORUM:
          return "Checkpoint signatures do not reach quorum";
        case E::UNKNOWN_BLOCK:
          return "Checkpoint block is unknown";
        case E::TOO_FAR_AHEAD:
          return "Checkpoint height is too far above finalized height";
        case E::CONFLICTING_SIGNATURE:
          return "Validator already signed another checkpoint at this height";
      }
      abort();
    }

    CheckpointSystem(qtils::SharedRef<log::LoggingSystem> logging_system,
                     qtils::SharedRef<ValidatorRegistry> validator_registry,
                     qtils::SharedRef<FinalityGadget> finality_gadget,
                     qtils::SharedRef<ConsensusRecords> records,
                     const ConsensusConfig &config,
                     Quorum quorum);

    bool isCheckpointHeight(Height height) const;

    /// Registers candidate block, seals it if signatures already suffice
    outcome::result<std::optional<Checkpoint>> onBlock(
        const BlockHeader &header, const BlockHash &hash);

    /// Signature must be verified by caller
    outcome::result<std::optional<Checkpoint>> onSignature(
        const CheckpointSignature &signature);

    /// Records externally assembled checkpoint after re-checking quorum
    outcome::result<void> seal(const Checkpoint &checkpoint);

    const std::optional<Checkpoint> &latest() const {
      return latest_;
    }

    std::optional<Checkpoint> at(Height height) const;

   private:
    struct Candidate {
      std::optional<StateRoot> state_root;
      std::map<ValidatorId, CheckpointSignature> signatures;
      VotingPower power = 0;
    };

    outcome::result<void> checkSealable(Height height,
                                        const BlockHash &hash) const;
    outcome::result<std::optional<Checkpoint>> trySeal(Height height,
                                                       const BlockHash &hash);
    outcome::result<void> record(Checkpoint checkpoint);

    bool isSealed(Height height, const BlockHash &hash) const;

    log::Logger logger_;
    qtils::SharedRef<ValidatorRegistry> validator_registry_;
    qtils::SharedRef<FinalityGadget> finality_gadget_;
    qtils::SharedRef<ConsensusRecords> records_;
    Height interval_;
    Height lookahead_;
    Quorum quorum_;

    std::map<Height, std::map<BlockHash, Candidate>> candidates_;
    /// Block signed by each signer per pending height
    std::map<Height, std::map<ValidatorId, BlockHash>> signed_;
    std::optional<Checkpoint> latest_;
  };

}  // namespace keel::consensus
