/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "blockchain/validator_registry.hpp"
#include "consensus/finality_gadget.hpp"
#include "crypto/ed25519.hpp"
#include "log/logger.hpp"
#include "types/block.hpp"
#include "types/checkpoint.hpp"
#include "types/config.hpp"
#include "types/slashing_evidence.hpp"
#include "types/vote.hpp"
#include "utils/ordered_buffer.hpp"
#include "utils/safe_object.hpp"

namespace keel {
  class ConsensusRecords;
  class FinalizedBlockStream;
  class ForkChoice;
  class LeaderScheduler;
  class StakeTreasury;
}  // namespace keel

namespace keel::consensus {
  class Broadcaster;
  class CheckpointSystem;
  class EquivocationDetector;
  class RewardCalculator;
  class SlashingManager;
}  // namespace keel::consensus

namespace keel::consensus {

  /**
   * Consensus state machine of one node.
   *
   * Wires validator registry, leader scheduler, fork choice, finality gadget,
   * checkpoints, equivocation detection, slashing and rewards behind one
   * lock. Transport threads deliver blocks, votes and checkpoint signatures;
   * timer drives slots. Signatures are verified before taking the lock, own
   * messages are broadcast after releasing it.
   *
   * When node has validator key it proposes in its slots and votes:
   * - one prepare per (height, round), for canonical blocks only;
   * - commit only for block it prepared once the block is prepared;
   * - after commit at a height, nothing conflicting with that block.
   *
   * Epoch accounting reads the finalized chain only. Every block carries
   * commit votes for its parent and signed slashing evidence. Rotation to
   * epoch `e` is anchored on the last finalized block before epoch `e - 1`
   * and settles participation, rewards and evidence of every finalized block
   * up to the anchor, so all honest nodes derive the same validator set
   * whenever they rotate.
   */
  class ConsensusEngine {
   public:
    enum class Error {
      INVALID_SIGNATURE = 1,
      UNKNOWN_VALIDATOR,
      WRONG_PROPOSER,
      FINALIZED_BLOCK_MISSING,
      BODY_ROOT_MISMATCH,
      PAYLOAD_TOO_LARGE,
      INVALID_ATTESTATION,
      INVALID_EVIDENCE,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::INVALID_SIGNATURE:
          return "Invalid signature";
        case E::UNKNOWN_VALIDATOR:
          return "Message from unknown validator";
        case E::WRONG_PROPOSER:
          return "Block proposer is not scheduled for its slot and round";
        case E::FINALIZED_BLOCK_MISSING:
          return "Finalized block is not in block tree";
        case E::BODY_ROOT_MISMATCH:
          return "Block body does not match body root of header";
        case E::PAYLOAD_TOO_LARGE:
          return "Block payload exceeds size limit";
        case E::INVALID_ATTESTATION:
          return "Block carries invalid parent attestation";
        case E::INVALID_EVIDENCE:
          return "Block carries invalid slashing evidence";
      }
      abort();
    }

    ConsensusEngine(qtils::SharedRef<log::LoggingSystem> logging_system,
                    const ConsensusConfig &config,
                    const Block &genesis,
                    qtils::SharedRef<StakeTreasury> treasury,
                    qtils::SharedRef<ConsensusRecords> records,
                    qtils::SharedRef<FinalizedBlockStream> finalized_stream,
                    qtils::SharedRef<Broadcaster> broadcaster,
                    std::optional<crypto::ed25519::KeyPair> keypair);

    ~ConsensusEngine();

    outcome::result<void> deliverBlock(const Block &block);

    outcome::result<void> deliverVote(const SignedVote &vote);

    outcome::result<void> deliverCheckpointSignature(
        const CheckpointSignature &signature);

    /// Starts slot: pending epoch rotations, orphan expiry, proposal by leader
    outcome::result<void> onSlot(Slot slot);

    /// Backup proposal when leader of current slot stays silent
    outcome::result<void> onLeaderTimeout(Slot slot, uint64_t elapsed_ms);

    [[nodiscard]] BlockHash head() const;

    [[nodiscard]] BlockHeader headHeader() const;

    [[nodiscard]] FinalizedBlock latestFinalized() const;

    [[nodiscard]] std::optional<FinalizedBlock> finalizedAt(
        Height height) const;

    [[nodiscard]] std::optional<BlockStatus> status(
        const BlockHash &hash) const;

    [[nodiscard]] std::optional<Checkpoint> latestCheckpoint() const;

    [[nodiscard]] bool isHalted() const;

    [[nodiscard]] Epoch epoch() const;

    [[nodiscard]] ValidatorRegistry::SnapshotPtr validatorSet() const;

    [[nodiscard]] std::optional<Validator> validator(
        const ValidatorId &id) const;

    [[nodiscard]] std::vector<SlashingRecord> slashings() const;

    const std::optional<ValidatorId> &localValidator() const {
      return self_;
    }

   private:
    struct State {
      std::shared_ptr<ValidatorRegistry> validator_registry;
      std::shared_ptr<LeaderScheduler> leader_scheduler;
      std::shared_ptr<ForkChoice> fork_choice;
      std::shared_ptr<FinalityGadget> finality_gadget;
      std::shared_ptr<CheckpointSystem> checkpoint_system;
      std::shared_ptr<EquivocationDetector> equivocation_detector;
      std::shared_ptr<SlashingManager> slashing_manager;
      std::shared_ptr<RewardCalculator> reward_calculator;

      Epoch epoch = 0;
      Slot slot = 0;
      Slot highest_block_slot = 0;
      std::optional<std::pair<Slot, Round>> last_proposal;
      Height applied_height = 0;

      /// Anchor of last rotation
      Height anchor_height = 0;
      /// Finalized blocks up to here are settled in epoch accounting
      Height accounted_height = 0;

      /// Blocks of epochs whose validator set is not built yet
      BoundedFifo<Block> future_blocks{0};
      /// Detected evidence waiting for inclusion into own block
      BoundedFifo<SlashingEvidence> pending_evidence{0};

      /// Own prepare per (height, round)
      std::map<std::pair<Height, Round>, BlockHash> prepared;
      /// Own commit per height
      std::map<Height, BlockHash> locks;
    };

    struct Outbox {
      std::vector<Block> blocks;
      std::vector<SignedVote> votes;
      std::vector<CheckpointSignature> checkpoint_signatures;
    };

    outcome::result<void> integrateBlock(State &state, const Block &block);
    outcome::result<void> processVote(State &state, const SignedVote &vote);
    outcome::result<void> processCheckpointSignature(
        State &state, const CheckpointSignature &signature);
    outcome::result<void> onCheckpointSealed(State &state,
                                             const Checkpoint &checkpoint);
    void queueEvidence(State &state, const SlashingEvidence &evidence);
    void applyEvidence(State &state,
                       const SlashingEvidence &evidence,
                       Height height);

    /// Settles finality, head and own votes until nothing changes
    outcome::result<void> settle(State &state, Outbox &outbox);
    outcome::result<bool> syncFinalized(State &state);
    size_t castVotes(State &state, Outbox &outbox);
    outcome::result<bool> voteFor(State &state,
                                  Outbox &outbox,
                                  const BlockHash &hash);
    bool conflictsWithLocks(const State &state,
                            const BlockHash &hash,
                            Height height) const;

    outcome::result<void> advanceEpochs(State &state);
    outcome::result<std::optional<Block>> rotationAnchor(
        const State &state, Epoch next_epoch) const;
    outcome::result<void> closeEpoch(State &state,
                                     Epoch next_epoch,
                                     const Block &anchor);
    outcome::result<void> propose(State &state,
                                  Outbox &outbox,
                                  Slot slot,
                                  Round round);

    void broadcast(const Outbox &outbox);

    log::Logger logger_;
    ConsensusConfig config_;
    TimestampMs genesis_time_;
    qtils::SharedRef<StakeTreasury> treasury_;
    qtils::SharedRef<ConsensusRecords> records_;
    qtils::SharedRef<FinalizedBlockStream> finalized_stream_;
    qtils::SharedRef<Broadcaster> broadcaster_;
    std::optional<crypto::ed25519::KeyPair> keypair_;
    std::optional<ValidatorId> self_;

    SafeObject<State> state_;
  };

}  // namespace keel::consensus
