/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/finality_gadget.hpp"

#include <ranges>

#include "blockchain/consensus_records.hpp"
#include "blockchain/validator_registry.hpp"

namespace keel::consensus {

  FinalityGadget::FinalityGadget(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<ValidatorRegistry> validator_registry,
      qtils::SharedRef<ConsensusRecords> records,
      const ConsensusConfig &config,
      Quorum quorum,
      const Block &genesis)
      : logger_{logging_system->getLogger("FinalityGadget", "finality")},
        validator_registry_{std::move(validator_registry)},
        records_{std::move(records)},
        quorum_{quorum},
        mode_{config.finality},
        safety_window_{config.safety_window},
        vote_buffer_expiry_heights_{config.vote_buffer_expiry_heights},
        buffered_{config.vote_buffer_limit} {
    auto hash = genesis.hash();
    auto &header = genesis.header;
    trackers_.emplace(hash,
                      Tracker{
                          .hash = hash,
                          .parent = header.parent_hash,
                          .height = header.height,
                          .round = header.round,
                          .state_root = header.state_root,
                          .status = BlockStatus::Finalized,
                      });
    FinalizedBlock record{
        .height = header.height,
        .block_hash = hash,
        .state_root = header.state_root,
        .round = header.round,
        .finalized_by = FinalizedBy::Genesis,
        .power = validator_registry_->totalPower(),
    };
    finalized_.emplace(record.height, record);
    finalized_hashes_.emplace(hash, record.height);
    if (auto res = records_->putFinalized(record); res.has_error()) {
      SL_ERROR(logger_, "Genesis finality record not stored: {}", res.error());
    }
  }

  outcome::result<std::vector<BlockHash>> FinalityGadget::onBlock(
      const BlockHeader &header, const BlockHash &hash) {
    std::vector<BlockHash> prepared;
    if (trackers_.contains(hash)
        or header.height <= latestFinalized().height) {
      return prepared;
    }
    auto &tracker = trackers_
                        .emplace(hash,
                                 Tracker{
                                     .hash = hash,
                                     .parent = header.parent_hash,
                                     .height = header.height,
                                     .round = header.round,
                                     .state_root = header.state_root,
                                 })
                        .first->second;
    SL_TRACE(logger_, "Tracking block {}", BlockIndexRef{header.height, hash});

    auto pending = buffered_.extract(
        [&](const SignedVote &vote) { return vote.data.block_hash == hash; });
    for (auto &vote : pending) {
      if (not validator_registry_->isEligible(vote.data.validator)) {
        continue;
      }
      auto res = applyVote(tracker, vote);
      if (res.has_error()) {
        if (halted_) {
          return res.error();
        }
        SL_WARN(logger_, "Buffered vote {} rejected: {}", vote.data, res.error());
        continue;
      }
      if (res.value().prepared) {
        prepared.emplace_back(hash);
      }
    }
    return prepared;
  }

  outcome::result<FinalityGadget::VoteReceipt> FinalityGadget::onVote(
      const SignedVote &vote) {
    if (halted_) {
      return Error::HALTED;
    }
    auto &data = vote.data;
    if (not validator_registry_->validator(data.validator)) {
      return Error::UNKNOWN_VALIDATOR;
    }
    if (not validator_registry_->isEligible(data.validator)) {
      return Error::INELIGIBLE_VOTER;
    }

    auto it = trackers_.find(data.block_hash);
    if (it == trackers_.end()) {
      if (data.height <= latestFinalized().height) {
        return VoteReceipt{.status = VoteStatus::Stale};
      }
      if (auto dropped = buffered_.push(vote)) {
        SL_WARN(logger_,
                "VoteDropped: buffer of {} votes is full, dropped {}",
                buffered_.capacity(),
                dropped->data);
      }
      return VoteReceipt{.status = VoteStatus::Buffered};
    }
    return applyVote(it->second, vote);
  }

  outcome::result<FinalityGadget::VoteReceipt> FinalityGadget::applyVote(
      Tracker &tracker, const SignedVote &vote) {
    auto &data = vote.data;
    if (data.height != tracker.height) {
      return Error::HEIGHT_MISMATCH;
    }
    if (data.round != tracker.round) {
      return Error::ROUND_MISMATCH;
    }

    VoteReceipt receipt;
    auto power = validator_registry_->votingPower(data.validator);
    auto &ballot =
        data.phase() == VotePhase::Prepare ? tracker.prepares : tracker.commits;
    auto &ballot_power = data.phase() == VotePhase::Prepare
                           ? tracker.prepare_power
                           : tracker.commit_power;
    if (not ballot.emplace(data.validator, vote).second) {
      receipt.status = VoteStatus::Duplicate;
      return receipt;
    }
    ballot_power += power;
    SL_TRACE(logger_,
             "Counted {}, {} power {}/{}",
             data,
             data.phase(),
             ballot_power,
             validator_registry_->totalPower());

    BOOST_OUTCOME_TRY(advance(tracker, receipt));
    return receipt;
  }

  outcome::result<void> FinalityGadget::advance(Tracker &tracker,
                                                VoteReceipt &receipt) {
    auto total = validator_registry_->totalPower();

    if (tracker.status == BlockStatus::Proposed
        and quorum_.reached(tracker.prepare_power, total)) {
      tracker.status = BlockStatus::Prepared;
      receipt.prepared = true;
      SL_DEBUG(logger_,
               "Block {} prepared with power {}/{}",
               BlockIndexRef{tracker.height, tracker.hash},
               tracker.prepare_power,
               total);
    }

    // Commit votes seen before prepare quorum count from here on
    if (tracker.status != BlockStatus::Prepared
        or not quorum_.reached(tracker.commit_power, total)) {
      return outcome::success();
    }
    tracker.status = BlockStatus::Committed;
    receipt.committed = true;
    SL_DEBUG(logger_,
             "Block {} committed with power {}/{}",
             BlockIndexRef{tracker.height, tracker.hash},
             tracker.commit_power,
             total);

    if (not std::holds_alternative<BftFinality>(mode_)) {
      return outcome::success();
    }

    QuorumCertificate qc{
        .block_hash = tracker.hash,
        .height = tracker.height,
        .round = tracker.round,
        .votes = {},
        .power = tracker.commit_power,
    };
    for (auto &vote : tracker.commits | std::views::values) {
      qc.votes.emplace_back(vote);
    }
    BOOST_OUTCOME_TRY(
        finalize(tracker.hash, FinalizedBy::Quorum, tracker.commit_power));
    qcs_.try_emplace(qc.height, std::move(qc));
    return outcome::success();
  }

  outcome::result<void> FinalityGadget::finalize(const BlockHash &hash,
                                                 FinalizedBy finalized_by,
                                                 VotingPower power) {
    if (halted_) {
      return Error::HALTED;
    }
    auto it = trackers_.find(hash);
    if (it == trackers_.end()) {
      if (finalized_hashes_.contains(hash)) {
        return outcome::success();
      }
      return Error::UNKNOWN_BLOCK;
    }
    auto &target = it->second;
    auto &latest = latestFinalized();

    if (target.height <= latest.height) {
      if (finalized_.at(target.height).block_hash == hash) {
        return outcome::success();
      }
      return safetyViolation(hash, target.height);
    }

    // Non-finalized chain from target down to the latest finalized block
    std::vector<Tracker *> chain{&target};
    while (chain.back()->height > latest.height + 1) {
      auto parent = trackers_.find(chain.back()->parent);
      if (parent == trackers_.end()) {
        return Error::UNKNOWN_BLOCK;
      }
      chain.emplace_back(&parent->second);
    }
    if (chain.back()->parent != latest.block_hash) {
      return safetyViolation(hash, target.height);
    }

    for (auto *tracker : chain | std::views::reverse) {
      FinalizedBlock record{
          .height = tracker->height,
          .block_hash = tracker->hash,
          .state_root = tracker->state_root,
          .round = tracker->round,
          .finalized_by =
              tracker == &target ? finalized_by : FinalizedBy::Descendant,
          .power = power,
      };
      BOOST_OUTCOME_TRY(records_->putFinalized(record));
      tracker->status = BlockStatus::Finalized;
      finalized_.emplace(record.height, record);
      finalized_hashes_.emplace(record.block_hash, record.height);
    }
    SL_INFO(logger_,
            "Finalized {} with power {}, {} blocks",
            BlockIndexRef{target.height, target.hash},
            power,
            chain.size());

    auto finalized_height = target.height;
    abandonConflicting(finalized_height);

    auto expired = buffered_.extract([&](const SignedVote &vote) {
      return vote.data.height + vote_buffer_expiry_heights_ < finalized_height;
    });
    if (not expired.empty()) {
      SL_DEBUG(logger_, "{} buffered votes expired", expired.size());
    }

    prune();
    return outcome::success();
  }

  outcome::result<void> FinalityGadget::safetyViolation(const BlockHash &hash,
                                                        Height height) {
    halted_ = true;
    auto finalized = latestFinalized();
    SL_CRITICAL(logger_,
                "SAFETY VIOLATION: block {} conflicts with finalized {}; "
                "finalization halted, operator action required",
                BlockIndexRef{height, hash},
                BlockIndexRef{finalized.height, finalized.block_hash});
    return Error::SAFETY_VIOLATION;
  }

  void FinalityGadget::abandonConflicting(Height finalized_height) {
    for (auto &tracker : trackers_ | std::views::values) {
      if (tracker.status == BlockStatus::Finalized
          or tracker.status == BlockStatus::Abandoned
          or tracker.height > finalized_height) {
        continue;
      }
      if (finalized_.at(tracker.height).block_hash != tracker.hash) {
        tracker.status = BlockStatus::Abandoned;
        SL_DEBUG(logger_,
                 "Block {} abandoned, conflicting block finalized",
                 BlockIndexRef{tracker.height, tracker.hash});
      }
    }
  }

  void FinalityGadget::prune() {
    auto finalized_height = latestFinalized().height;
    if (finalized_height <= safety_window_) {
      return;
    }
    auto keep_from = finalized_height - safety_window_;
    std::erase_if(trackers_, [&](const auto &item) {
      return item.second.height < keep_from;
    });
  }

  bool FinalityGadget::conflictsWithFinality(const BlockHash &hash) const {
    if (finalized_hashes_.contains(hash)) {
      return false;
    }
    auto it = trackers_.find(hash);
    if (it == trackers_.end()) {
      return false;
    }
    auto &latest = latestFinalized();
    if (it->second.height <= latest.height) {
      return true;
    }
    while (it != trackers_.end() and it->second.height > latest.height + 1) {
      it = trackers_.find(it->second.parent);
    }
    return it != trackers_.end() and it->second.parent != latest.block_hash;
  }

  std::optional<BlockHash> FinalityGadget::ancestorAt(const BlockHash &hash,
                                                      Height height) const {
    auto it = trackers_.find(hash);
    while (it != trackers_.end() and it->second.height > height) {
      it = trackers_.find(it->second.parent);
    }
    if (it == trackers_.end() or it->second.height != height) {
      return std::nullopt;
    }
    return it->second.hash;
  }

  outcome::result<void> FinalityGadget::onHead(const BlockHash &head) {
    auto head_it = trackers_.find(head);
    if (head_it == trackers_.end()) {
      return outcome::success();
    }
    auto head_height = head_it->second.height;

    for (auto &tracker : trackers_ | std::views::values) {
      if (tracker.status == BlockStatus::Finalized
          or tracker.status == BlockStatus::Abandoned
          or head_height < tracker.height + safety_window_) {
        continue;
      }
      if (ancestorAt(head, tracker.height) != tracker.hash) {
        tracker.status = BlockStatus::Abandoned;
        SL_DEBUG(logger_,
                 "Block {} abandoned, head {} diverged",
                 BlockIndexRef{tracker.height, tracker.hash},
                 BlockIndexRef{head_height, head});
      }
    }

    if (auto depth_mode = std::get_if<ConfirmationDepthFinality>(&mode_)) {
      if (halted_ or head_height < depth_mode->depth) {
        return outcome::success();
      }
      auto target_height = head_height - depth_mode->depth;
      if (target_height <= latestFinalized().height) {
        return outcome::success();
      }
      auto target = ancestorAt(head, target_height);
      if (not target) {
        return Error::UNKNOWN_BLOCK;
      }
      return finalize(*target, FinalizedBy::Depth, 0);
    }
    return outcome::success();
  }

  std::optional<BlockStatus> FinalityGadget::status(
      const BlockHash &hash) const {
    if (auto it = trackers_.find(hash); it != trackers_.end()) {
      return it->second.status;
    }
    if (finalized_hashes_.contains(hash)) {
      return BlockStatus::Finalized;
    }
    return std::nullopt;
  }

  std::vector<SignedVote> FinalityGadget::votes(const BlockHash &hash,
                                                VotePhase phase) const {
    std::vector<SignedVote> result;
    auto it = trackers_.find(hash);
    if (it == trackers_.end()) {
      return result;
    }
    auto &ballot = phase == VotePhase::Prepare ? it->second.prepares
                                               : it->second.commits;
    for (auto &vote : ballot | std::views::values) {
      result.emplace_back(vote);
    }
    return result;
  }

  std::optional<FinalizedBlock> FinalityGadget::finalizedAt(
      Height height) const {
    if (auto it = finalized_.find(height); it != finalized_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  const FinalizedBlock &FinalityGadget::latestFinalized() const {
    return finalized_.rbegin()->second;
  }

  std::optional<QuorumCertificate> FinalityGadget::qcAt(Height height) const {
    if (auto it = qcs_.find(height); it != qcs_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

}  // namespace keel::consensus
