/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/consensus_engine.hpp"

#include <algorithm>
#include <ranges>
#include <set>

#include <qtils/error_throw.hpp>

#include "blockchain/consensus_records.hpp"
#include "blockchain/finalized_block_stream.hpp"
#include "blockchain/fork_choice.hpp"
#include "blockchain/impl/validator_registry_impl.hpp"
#include "blockchain/leader_scheduler.hpp"
#include "blockchain/stake_treasury.hpp"
#include "consensus/broadcaster.hpp"
#include "consensus/checkpoint_system.hpp"
#include "consensus/equivocation_detector.hpp"
#include "consensus/reward_calculator.hpp"
#include "consensus/signing.hpp"
#include "consensus/slashing_manager.hpp"
#include "types/constants.hpp"

namespace keel::consensus {

  ConsensusEngine::ConsensusEngine(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      const ConsensusConfig &config,
      const Block &genesis,
      qtils::SharedRef<StakeTreasury> treasury,
      qtils::SharedRef<ConsensusRecords> records,
      qtils::SharedRef<FinalizedBlockStream> finalized_stream,
      qtils::SharedRef<Broadcaster> broadcaster,
      std::optional<crypto::ed25519::KeyPair> keypair)
      : logger_{logging_system->getLogger("ConsensusEngine", "consensus")},
        config_{config},
        genesis_time_{genesis.header.timestamp},
        treasury_{std::move(treasury)},
        records_{std::move(records)},
        finalized_stream_{std::move(finalized_stream)},
        broadcaster_{std::move(broadcaster)},
        keypair_{std::move(keypair)} {
    if (keypair_) {
      self_ = crypto::ed25519::publicKey(*keypair_);
    }
    auto quorum = Quorum::create(config_.quorum);
    if (quorum.has_error()) {
      qtils::raise(quorum.error());
    }

    auto &state = state_.unsafeGet();
    state.validator_registry = std::make_shared<ValidatorRegistryImpl>(
        logging_system, treasury_, records_, config_);
    state.leader_scheduler = std::make_shared<LeaderScheduler>(
        logging_system, state.validator_registry, config_);
    state.fork_choice = std::make_shared<ForkChoice>(
        logging_system, state.validator_registry, config_, genesis);
    state.finality_gadget =
        std::make_shared<FinalityGadget>(logging_system,
                                         state.validator_registry,
                                         records_,
                                         config_,
                                         quorum.value(),
                                         genesis);
    state.checkpoint_system =
        std::make_shared<CheckpointSystem>(logging_system,
                                           state.validator_registry,
                                           state.finality_gadget,
                                           records_,
                                           config_,
                                           quorum.value());
    state.equivocation_detector =
        std::make_shared<EquivocationDetector>(logging_system, config_);
    state.slashing_manager = std::make_shared<SlashingManager>(
        logging_system, state.validator_registry, records_, config_);
    state.reward_calculator =
        std::make_shared<RewardCalculator>(logging_system, config_.rewards);

    state.slot = genesis.header.slot;
    state.highest_block_slot = genesis.header.slot;
    state.applied_height = genesis.header.height;
    state.anchor_height = genesis.header.height;
    state.accounted_height = genesis.header.height;
    state.future_blocks = BoundedFifo<Block>{config_.orphan_buffer_limit};
    state.pending_evidence =
        BoundedFifo<SlashingEvidence>{MAX_PENDING_EVIDENCE};
    if (auto res = finalized_stream_->append(genesis); res.has_error()) {
      qtils::raise(res.error());
    }

    SL_INFO(logger_,
            "Engine started at genesis {:0x}, {} active validators, "
            "local validator {}",
            genesis.hash(),
            state.validator_registry->current()->active_count,
            self_ ? fmt::format("{:0x}", *self_) : std::string{"none"});
  }

  ConsensusEngine::~ConsensusEngine() = default;

  namespace {

    /// Body checks which need no consensus state
    outcome::result<void> checkBody(const Block &block) {
      auto &header = block.header;
      if (block.payload.size() > MAX_PAYLOAD_BYTES) {
        return ConsensusEngine::Error::PAYLOAD_TOO_LARGE;
      }
      if (block.bodyRoot() != header.body_root) {
        return ConsensusEngine::Error::BODY_ROOT_MISMATCH;
      }

      if (block.attestations.size() > VALIDATOR_REGISTRY_LIMIT) {
        return ConsensusEngine::Error::INVALID_ATTESTATION;
      }
      std::set<ValidatorId> voters;
      for (auto &vote : block.attestations) {
        auto &data = vote.data;
        if (data.phase() != VotePhase::Commit
            or data.block_hash != header.parent_hash
            or data.height + 1 != header.height
            or not voters.emplace(data.validator).second
            or not verifyVote(vote)) {
          return ConsensusEngine::Error::INVALID_ATTESTATION;
        }
      }

      if (block.evidence.size() > MAX_BLOCK_EVIDENCE) {
        return ConsensusEngine::Error::INVALID_EVIDENCE;
      }
      for (auto &evidence : block.evidence) {
        // Unavailability is derived from finalized chain, never carried
        if (not evidence.isSigned()) {
          return ConsensusEngine::Error::INVALID_EVIDENCE;
        }
      }
      return outcome::success();
    }

  }  // namespace

  outcome::result<void> ConsensusEngine::deliverBlock(const Block &block) {
    if (not verifyBlock(block)) {
      SL_WARN(logger_,
              "Block {} rejected: bad proposer signature",
              block.header);
      return Error::INVALID_SIGNATURE;
    }
    if (auto res = checkBody(block); res.has_error()) {
      SL_WARN(logger_, "Block {} rejected: {}", block.header, res.error());
      return res.error();
    }
    Outbox outbox;
    auto res = state_.exclusiveAccess(
        [&](State &state) -> outcome::result<void> {
          BOOST_OUTCOME_TRY(integrateBlock(state, block));
          return settle(state, outbox);
        });
    broadcast(outbox);
    return res;
  }

  outcome::result<void> ConsensusEngine::deliverVote(const SignedVote &vote) {
    if (not verifyVote(vote)) {
      SL_WARN(logger_, "Vote {} rejected: bad signature", vote.data);
      return Error::INVALID_SIGNATURE;
    }
    Outbox outbox;
    auto res = state_.exclusiveAccess(
        [&](State &state) -> outcome::result<void> {
          BOOST_OUTCOME_TRY(processVote(state, vote));
          return settle(state, outbox);
        });
    broadcast(outbox);
    return res;
  }

  outcome::result<void> ConsensusEngine::deliverCheckpointSignature(
      const CheckpointSignature &signature) {
    if (not verifyCheckpointSignature(signature)) {
      SL_WARN(logger_,
              "Checkpoint signature of {:0x} rejected: bad signature",
              signature.validator);
      return Error::INVALID_SIGNATURE;
    }
    Outbox outbox;
    auto res = state_.exclusiveAccess(
        [&](State &state) -> outcome::result<void> {
          BOOST_OUTCOME_TRY(processCheckpointSignature(state, signature));
          return settle(state, outbox);
        });
    broadcast(outbox);
    return res;
  }

  outcome::result<void> ConsensusEngine::onSlot(Slot slot) {
    Outbox outbox;
    auto res = state_.exclusiveAccess(
        [&](State &state) -> outcome::result<void> {
          if (slot <= state.slot and state.slot != 0) {
            return outcome::success();
          }
          state.slot = slot;
          BOOST_OUTCOME_TRY(advanceEpochs(state));

          if (auto expired = state.fork_choice->expireOrphans(slot);
              expired > 0) {
            SL_DEBUG(logger_, "{} orphan blocks expired at slot {}", expired, slot);
          }

          if (self_ and state.epoch < config_.epochOf(slot)) {
            SL_DEBUG(logger_,
                     "Not proposing at slot {}: validator set of epoch {} "
                     "awaits finality",
                     slot,
                     config_.epochOf(slot));
          } else if (self_) {
            auto leader = state.leader_scheduler->leaderFor(slot);
            if (leader.has_error()) {
              SL_WARN(logger_,
                      "No leader for slot {}: {}",
                      slot,
                      leader.error());
            } else if (leader.value() == *self_) {
              BOOST_OUTCOME_TRY(propose(state, outbox, slot, 0));
            }
          }
          return settle(state, outbox);
        });
    broadcast(outbox);
    return res;
  }

  outcome::result<void> ConsensusEngine::onLeaderTimeout(Slot slot,
                                                         uint64_t elapsed_ms) {
    if (not self_) {
      return outcome::success();
    }
    Outbox outbox;
    auto res = state_.exclusiveAccess(
        [&](State &state) -> outcome::result<void> {
          auto round = state.leader_scheduler->attemptAt(elapsed_ms);
          if (round == 0 or slot != state.slot
              or state.highest_block_slot >= slot
              or state.epoch < config_.epochOf(slot)) {
            return outcome::success();
          }
          BOOST_OUTCOME_TRY(auto proposer,
                            state.leader_scheduler->proposerFor(slot, round));
          SL_DEBUG(logger_,
                   "Leader of slot {} silent for {} ms, round {} proposer {:0x}",
                   slot,
                   elapsed_ms,
                   round,
                   proposer);
          if (proposer != *self_) {
            return outcome::success();
          }
          BOOST_OUTCOME_TRY(propose(state, outbox, slot, round));
          return settle(state, outbox);
        });
    broadcast(outbox);
    return res;
  }

  outcome::result<void> ConsensusEngine::propose(State &state,
                                                 Outbox &outbox,
                                                 Slot slot,
                                                 Round round) {
    if (state.last_proposal == std::pair{slot, round}) {
      return outcome::success();
    }
    auto &fork_choice = *state.fork_choice;
    auto &parent = fork_choice.headHeader();
    if (parent.slot >= slot) {
      SL_DEBUG(logger_,
               "Skip proposal at slot {}: head is already at slot {}",
               slot,
               parent.slot);
      return outcome::success();
    }

    qtils::ByteVec payload;
    auto attestations =
        state.finality_gadget->votes(fork_choice.head(), VotePhase::Commit);
    std::vector<SlashingEvidence> evidence;
    for (auto &pending : state.pending_evidence.items()) {
      if (evidence.size() >= MAX_BLOCK_EVIDENCE) {
        break;
      }
      if (not records_->evidence(pending.hash())) {
        evidence.emplace_back(pending);
      }
    }
    auto body_root = bodyRootOf(payload, attestations, evidence);
    BlockHeader header{
        .parent_hash = fork_choice.head(),
        .height = parent.height + 1,
        .slot = slot,
        .round = round,
        .state_root = nextStateRoot(parent.state_root, body_root),
        .proposer = *self_,
        .timestamp = genesis_time_ + slot * config_.slot_duration_ms,
        .body_root = body_root,
    };
    BOOST_OUTCOME_TRY(auto block,
                      signBlock(*keypair_,
                                std::move(header),
                                std::move(payload),
                                std::move(attestations),
                                std::move(evidence)));
    state.last_proposal = std::pair{slot, round};

    SL_INFO(logger_, "Proposed block {} in round {}", block.header, round);
    BOOST_OUTCOME_TRY(integrateBlock(state, block));
    outbox.blocks.emplace_back(std::move(block));
    return outcome::success();
  }

  outcome::result<void> ConsensusEngine::integrateBlock(State &state,
                                                        const Block &block) {
    auto hash = block.hash();
    auto &header = block.header;
    if (state.fork_choice->contains(hash)
        or state.finality_gadget->status(hash) == BlockStatus::Finalized) {
      return outcome::success();
    }

    if (config_.epochOf(header.slot) > state.epoch) {
      if (state.future_blocks.any(
              [&](const Block &buffered) { return buffered.hash() == hash; })) {
        return outcome::success();
      }
      SL_DEBUG(logger_,
               "Block {} buffered until epoch {} starts",
               header,
               config_.epochOf(header.slot));
      if (auto dropped = state.future_blocks.push(block)) {
        SL_WARN(logger_,
                "Future block buffer of {} is full, dropped {}",
                state.future_blocks.capacity(),
                dropped->header);
      }
      return outcome::success();
    }

    BOOST_OUTCOME_TRY(auto expected,
                      state.leader_scheduler->proposerFor(header.slot,
                                                          header.round));
    if (expected != header.proposer) {
      SL_WARN(logger_,
              "Block {} rejected: proposer {:0x} is not scheduled, "
              "expected {:0x}",
              header,
              header.proposer,
              expected);
      return Error::WRONG_PROPOSER;
    }
    for (auto &evidence : block.evidence) {
      if (not state.slashing_manager->verify(evidence)) {
        SL_WARN(logger_,
                "Block {} rejected: invalid {} evidence against {:0x}",
                header,
                evidence.offense,
                evidence.offender);
        return Error::INVALID_EVIDENCE;
      }
    }

    BOOST_OUTCOME_TRY(auto insertion, state.fork_choice->onBlock(block));
    for (auto &integrated_hash : insertion.integrated) {
      auto entry = state.fork_choice->arena().get(integrated_hash);
      if (entry == nullptr) {
        continue;
      }
      auto integrated = entry->header();
      state.highest_block_slot =
          std::max(state.highest_block_slot, integrated.slot);
      BOOST_OUTCOME_TRY(
          state.finality_gadget->onBlock(integrated, integrated_hash));
      BOOST_OUTCOME_TRY(auto checkpoint,
          state.checkpoint_system->onBlock(integrated, integrated_hash));
      if (checkpoint) {
        BOOST_OUTCOME_TRY(onCheckpointSealed(state, *checkpoint));
      }
    }
    return outcome::success();
  }

  outcome::result<void> ConsensusEngine::processVote(State &state,
                                                     const SignedVote &vote) {
    auto &data = vote.data;
    auto &registry = *state.validator_registry;
    auto &gadget = *state.finality_gadget;
    if (not registry.validator(data.validator)) {
      SL_WARN(logger_, "Vote {} rejected: unknown validator", data);
      return Error::UNKNOWN_VALIDATOR;
    }

    if (auto evidence = state.equivocation_detector->observe(
            vote, state.fork_choice->headHeader().height)) {
      queueEvidence(state, *evidence);
      return outcome::success();
    }
    if (data.height <= gadget.latestFinalized().height) {
      if (auto qc = gadget.qcAt(data.height)) {
        if (auto evidence =
                state.equivocation_detector->observeAgainstFinalized(vote,
                                                                     *qc)) {
          queueEvidence(state, *evidence);
          return outcome::success();
        }
      }
    }

    auto receipt = gadget.onVote(vote);
    if (receipt.has_error()) {
      if (not gadget.isHalted()) {
        SL_WARN(logger_, "Vote {} rejected: {}", data, receipt.error());
      }
      return receipt.error();
    }
    auto status = receipt.value().status;
    if (status != FinalityGadget::VoteStatus::Counted
        and status != FinalityGadget::VoteStatus::Buffered) {
      return outcome::success();
    }
    state.fork_choice->onVote(data);
    return outcome::success();
  }

  outcome::result<void> ConsensusEngine::processCheckpointSignature(
      State &state, const CheckpointSignature &signature) {
    BOOST_OUTCOME_TRY(auto checkpoint,
                      state.checkpoint_system->onSignature(signature));
    if (checkpoint) {
      BOOST_OUTCOME_TRY(onCheckpointSealed(state, *checkpoint));
    }
    return outcome::success();
  }

  outcome::result<void> ConsensusEngine::onCheckpointSealed(
      State &state, const Checkpoint &checkpoint) {
    SL_INFO(logger_, "Checkpoint sealed: {}", checkpoint);
    BOOST_OUTCOME_TRY(syncFinalized(state));
    if (state.fork_choice->contains(checkpoint.block_hash)) {
      BOOST_OUTCOME_TRY(state.fork_choice->onCheckpoint(checkpoint.block_hash));
    }
    return outcome::success();
  }

  void ConsensusEngine::queueEvidence(State &state,
                                      const SlashingEvidence &evidence) {
    auto evidence_hash = evidence.hash();
    if (records_->evidence(evidence_hash)
        or state.pending_evidence.any([&](const SlashingEvidence &pending) {
             return pending.hash() == evidence_hash;
           })) {
      return;
    }
    SL_INFO(logger_,
            "{} evidence against {:0x} at height {} queued for inclusion",
            evidence.offense,
            evidence.offender,
            evidence.height);
    if (auto dropped = state.pending_evidence.push(evidence)) {
      SL_WARN(logger_,
              "Evidence queue is full, dropped {} evidence against {:0x}",
              dropped->offense,
              dropped->offender);
    }
  }

  void ConsensusEngine::applyEvidence(State &state,
                                      const SlashingEvidence &evidence,
                                      Height height) {
    auto res = state.slashing_manager->processEvidence(evidence, height);
    if (res.has_error()) {
      SL_WARN(logger_,
              "{} evidence against {:0x} not processed: {}",
              evidence.offense,
              evidence.offender,
              res.error());
      return;
    }
    SL_INFO(logger_,
            "{} evidence against {:0x} at height {}: {}",
            evidence.offense,
            evidence.offender,
            evidence.height,
            res.value());
  }

  outcome::result<void> ConsensusEngine::settle(State &state, Outbox &outbox) {
    while (true) {
      BOOST_OUTCOME_TRY(syncFinalized(state));
      BOOST_OUTCOME_TRY(advanceEpochs(state));
      if (not state.finality_gadget->isHalted()) {
        BOOST_OUTCOME_TRY(
            state.finality_gadget->onHead(state.fork_choice->head()));
        BOOST_OUTCOME_TRY(syncFinalized(state));
      }
      if (castVotes(state, outbox) == 0) {
        return outcome::success();
      }
    }
  }

  outcome::result<bool> ConsensusEngine::syncFinalized(State &state) {
    auto &gadget = *state.finality_gadget;
    auto &fork_choice = *state.fork_choice;
    auto latest = gadget.latestFinalized();
    if (latest.height <= state.applied_height) {
      return false;
    }

    // Stream takes blocks before fork choice prunes them
    for (auto height = state.applied_height + 1; height <= latest.height;
         ++height) {
      auto finalized = gadget.finalizedAt(height);
      auto entry =
          finalized ? fork_choice.arena().get(finalized->block_hash) : nullptr;
      if (entry == nullptr) {
        SL_ERROR(logger_, "Finalized block at height {} is missing", height);
        return Error::FINALIZED_BLOCK_MISSING;
      }
      BOOST_OUTCOME_TRY(finalized_stream_->append(entry->block));
      auto &included = entry->block.evidence;
      if (not included.empty()) {
        state.pending_evidence.extract([&](const SlashingEvidence &pending) {
          return std::ranges::count(included, pending) != 0;
        });
      }
      state.applied_height = height;
    }
    BOOST_OUTCOME_TRY(fork_choice.onFinalized(latest.block_hash));

    std::erase_if(state.prepared, [&](const auto &item) {
      return item.first.first <= latest.height;
    });
    std::erase_if(state.locks, [&](const auto &item) {
      return item.first <= latest.height;
    });
    return true;
  }

  size_t ConsensusEngine::castVotes(State &state, Outbox &outbox) {
    if (not self_ or state.finality_gadget->isHalted()
        or not state.validator_registry->isEligible(*self_)) {
      return 0;
    }
    size_t cast = outbox.votes.size();
    for (auto &hash : state.fork_choice->canonicalChain()) {
      auto res = voteFor(state, outbox, hash);
      if (res.has_error()) {
        SL_ERROR(logger_, "Voting for {:0x} failed: {}", hash, res.error());
        break;
      }
      if (not res.value()) {
        break;
      }
    }
    return outbox.votes.size() - cast;
  }

  bool ConsensusEngine::conflictsWithLocks(const State &state,
                                           const BlockHash &hash,
                                           Height height) const {
    auto &arena = state.fork_choice->arena();
    for (auto &[locked_height, locked_hash] : state.locks) {
      auto ancestor = locked_height <= height
                        ? arena.ancestorAt(hash, locked_height)
                        : arena.ancestorAt(locked_hash, height);
      auto expected = locked_height <= height ? locked_hash : hash;
      if (ancestor and *ancestor != expected) {
        return true;
      }
    }
    return false;
  }

  outcome::result<bool> ConsensusEngine::voteFor(State &state,
                                                 Outbox &outbox,
                                                 const BlockHash &hash) {
    auto &gadget = *state.finality_gadget;
    auto status = gadget.status(hash);
    if (not status or status == BlockStatus::Abandoned) {
      return false;
    }
    if (status == BlockStatus::Finalized) {
      return true;
    }
    auto entry = state.fork_choice->arena().get(hash);
    if (entry == nullptr) {
      return false;
    }
    auto header = entry->header();
    if (conflictsWithLocks(state, hash, header.height)) {
      SL_DEBUG(logger_,
               "Not voting for {}: conflicts with own commit",
               header);
      return false;
    }

    auto [prepared, first_prepare] =
        state.prepared.try_emplace(std::pair{header.height, header.round}, hash);
    if (prepared->second != hash) {
      return true;
    }
    if (first_prepare) {
      BOOST_OUTCOME_TRY(auto vote,
          signVote(*keypair_,
                   Vote::make(
                       *self_, hash, header.height, header.round,
                       VotePhase::Prepare)));
      BOOST_OUTCOME_TRY(processVote(state, vote));
      outbox.votes.emplace_back(std::move(vote));
    }

    status = gadget.status(hash);
    if ((status != BlockStatus::Prepared and status != BlockStatus::Committed)
        or state.locks.contains(header.height)) {
      return true;
    }
    state.locks.emplace(header.height, hash);
    BOOST_OUTCOME_TRY(auto vote,
        signVote(*keypair_,
                 Vote::make(
                     *self_, hash, header.height, header.round,
                     VotePhase::Commit)));
    SL_DEBUG(logger_, "Committing to {}", header);
    BOOST_OUTCOME_TRY(processVote(state, vote));
    outbox.votes.emplace_back(std::move(vote));

    if (state.checkpoint_system->isCheckpointHeight(header.height)) {
      BOOST_OUTCOME_TRY(auto signature,
          signCheckpoint(*keypair_,
                         CheckpointMessage{
                             .height = header.height,
                             .block_hash = hash,
                         }));
      auto res = processCheckpointSignature(state, signature);
      if (res.has_error()) {
        SL_WARN(logger_,
                "Own checkpoint signature for {} not applied: {}",
                header,
                res.error());
      }
      outbox.checkpoint_signatures.emplace_back(std::move(signature));
    }
    return true;
  }

  outcome::result<void> ConsensusEngine::advanceEpochs(State &state) {
    while (state.epoch < config_.epochOf(state.slot)) {
      auto next_epoch = state.epoch + 1;
      BOOST_OUTCOME_TRY(auto anchor, rotationAnchor(state, next_epoch));
      if (not anchor) {
        SL_TRACE(logger_,
                 "Rotation to epoch {} waits for finality to reach slot {}",
                 next_epoch,
                 config_.firstSlotOf(next_epoch - 1));
        return outcome::success();
      }
      BOOST_OUTCOME_TRY(closeEpoch(state, next_epoch, *anchor));

      auto ready = state.future_blocks.extract([&](const Block &block) {
        return config_.epochOf(block.header.slot) <= state.epoch;
      });
      for (auto &block : ready) {
        if (auto res = integrateBlock(state, block); res.has_error()) {
          SL_WARN(logger_,
                  "Buffered block {} rejected: {}",
                  block.header,
                  res.error());
        }
      }
    }
    return outcome::success();
  }

  outcome::result<std::optional<Block>> ConsensusEngine::rotationAnchor(
      const State &state, Epoch next_epoch) const {
    // Last finalized block before this slot, known once finality passes it
    auto boundary = config_.firstSlotOf(next_epoch - 1);
    auto anchor = finalized_stream_->at(state.anchor_height);
    if (not anchor) {
      return Error::FINALIZED_BLOCK_MISSING;
    }
    // Genesis anchors the epochs no finalized block precedes
    if (anchor->header.slot >= boundary) {
      return anchor;
    }
    for (auto height = state.anchor_height + 1; height <= state.applied_height;
         ++height) {
      auto block = finalized_stream_->at(height);
      if (not block) {
        return Error::FINALIZED_BLOCK_MISSING;
      }
      if (block->header.slot >= boundary) {
        return anchor;
      }
      anchor = std::move(block);
    }
    return std::optional<Block>{};
  }

  outcome::result<void> ConsensusEngine::closeEpoch(State &state,
                                                    Epoch next_epoch,
                                                    const Block &anchor) {
    auto &registry = *state.validator_registry;
    RewardMap rewards;
    auto accounted_from = state.accounted_height + 1;
    for (auto height = accounted_from; height <= anchor.header.height;
         ++height) {
      auto block = finalized_stream_->at(height);
      // Participation in a block is attested by its finalized child
      auto child = finalized_stream_->at(height + 1);
      if (not block or not child) {
        return Error::FINALIZED_BLOCK_MISSING;
      }
      auto &votes = child->attestations;
      auto snapshot = registry.snapshotFor(config_.epochOf(block->header.slot));
      for (auto &validator : snapshot->active()) {
        registry.recordParticipation(
            validator.id,
            std::ranges::any_of(votes, [&](const SignedVote &vote) {
              return vote.data.validator == validator.id;
            }));
      }
      auto block_rewards =
          state.reward_calculator->calculate(block->header, votes, *snapshot);
      for (auto &[validator, amount] : block_rewards) {
        rewards[validator] += amount;
      }
      for (auto &evidence : block->evidence) {
        applyEvidence(state, evidence, height);
      }
      state.accounted_height = height;
    }
    if (not rewards.empty()) {
      treasury_->applyReward(rewards);
    }

    auto current = registry.current();
    for (auto &active : current->active()) {
      auto validator = registry.validator(active.id);
      if (not validator
          or validator->consecutive_missed
                 < config_.slashing.unavailability_threshold) {
        continue;
      }
      applyEvidence(state,
                    state.equivocation_detector->unavailability(
                        active.id,
                        state.epoch,
                        anchor.header.height,
                        validator->consecutive_missed),
                    anchor.header.height);
    }

    SL_INFO(logger_,
            "Epoch {} closed at anchor {}: {} blocks accounted, {} accounts "
            "rewarded",
            state.epoch,
            anchor.header,
            anchor.header.height + 1 - accounted_from,
            rewards.size());

    BOOST_OUTCOME_TRY(registry.rotate(next_epoch, anchor.hash()));
    state.epoch = next_epoch;
    state.anchor_height = anchor.header.height;
    return outcome::success();
  }

  void ConsensusEngine::broadcast(const Outbox &outbox) {
    for (auto &block : outbox.blocks) {
      broadcaster_->broadcastBlock(block);
    }
    for (auto &vote : outbox.votes) {
      broadcaster_->broadcastVote(vote);
    }
    for (auto &signature : outbox.checkpoint_signatures) {
      broadcaster_->broadcastCheckpointSignature(signature);
    }
  }

  BlockHash ConsensusEngine::head() const {
    return state_.sharedAccess(
        [](const State &state) { return state.fork_choice->head(); });
  }

  BlockHeader ConsensusEngine::headHeader() const {
    return state_.sharedAccess(
        [](const State &state) { return state.fork_choice->headHeader(); });
  }

  FinalizedBlock ConsensusEngine::latestFinalized() const {
    return state_.sharedAccess([](const State &state) {
      return state.finality_gadget->latestFinalized();
    });
  }

  std::optional<FinalizedBlock> ConsensusEngine::finalizedAt(
      Height height) const {
    return state_.sharedAccess([&](const State &state) {
      return state.finality_gadget->finalizedAt(height);
    });
  }

  std::optional<BlockStatus> ConsensusEngine::status(
      const BlockHash &hash) const {
    return state_.sharedAccess(
        [&](const State &state) { return state.finality_gadget->status(hash); });
  }

  std::optional<Checkpoint> ConsensusEngine::latestCheckpoint() const {
    return state_.sharedAccess([](const State &state) {
      return state.checkpoint_system->latest();
    });
  }

  bool ConsensusEngine::isHalted() const {
    return state_.sharedAccess(
        [](const State &state) { return state.finality_gadget->isHalted(); });
  }

  Epoch ConsensusEngine::epoch() const {
    return state_.sharedAccess([](const State &state) { return state.epoch; });
  }

  ValidatorRegistry::SnapshotPtr ConsensusEngine::validatorSet() const {
    return state_.sharedAccess([](const State &state) {
      return state.validator_registry->current();
    });
  }

  std::optional<Validator> ConsensusEngine::validator(
      const ValidatorId &id) const {
    return state_.sharedAccess([&](const State &state) {
      return state.validator_registry->validator(id);
    });
  }

  std::vector<SlashingRecord> ConsensusEngine::slashings() const {
    return records_->evidenceLog();
  }

}  // namespace keel::consensus
