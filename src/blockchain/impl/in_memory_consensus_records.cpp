/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/in_memory_consensus_records.hpp"

#include <mutex>

namespace keel {

  namespace {
    template <typename Map, typename Key, typename Value>
    outcome::result<void> appendOnly(Map &map,
                                     const Key &key,
                                     const Value &value) {
      auto [it, inserted] = map.try_emplace(key, value);
      if (not inserted and not(it->second == value)) {
        return ConsensusRecordsError::ALREADY_RECORDED;
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<void> InMemoryConsensusRecords::putFinalized(
      const FinalizedBlock &finalized) {
    std::unique_lock lock{mutex_};
    auto it = finalized_.find(finalized.height);
    if (it != finalized_.end()) {
      // Same block may be recorded again with another justification
      if (it->second.block_hash != finalized.block_hash) {
        return ConsensusRecordsError::ALREADY_RECORDED;
      }
      return outcome::success();
    }
    finalized_.emplace(finalized.height, finalized);
    return outcome::success();
  }

  std::optional<FinalizedBlock> InMemoryConsensusRecords::finalizedAt(
      Height height) const {
    std::shared_lock lock{mutex_};
    if (auto it = finalized_.find(height); it != finalized_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  outcome::result<void> InMemoryConsensusRecords::putCheckpoint(
      const Checkpoint &checkpoint) {
    std::unique_lock lock{mutex_};
    return appendOnly(checkpoints_, checkpoint.height, checkpoint);
  }

  std::optional<Checkpoint> InMemoryConsensusRecords::checkpointAt(
      Height height) const {
    std::shared_lock lock{mutex_};
    if (auto it = checkpoints_.find(height); it != checkpoints_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  outcome::result<void> InMemoryConsensusRecords::putEvidence(
      const SlashingRecord &record) {
    std::unique_lock lock{mutex_};
    auto [it, inserted] =
        evidence_index_.try_emplace(record.evidence_hash, evidence_.size());
    if (not inserted) {
      if (evidence_[it->second].evidence == record.evidence) {
        return outcome::success();
      }
      return ConsensusRecordsError::ALREADY_RECORDED;
    }
    evidence_.emplace_back(record);
    return outcome::success();
  }

  std::optional<SlashingRecord> InMemoryConsensusRecords::evidence(
      const Hash256 &evidence_hash) const {
    std::shared_lock lock{mutex_};
    if (auto it = evidence_index_.find(evidence_hash);
        it != evidence_index_.end()) {
      return evidence_[it->second];
    }
    return std::nullopt;
  }

  std::vector<SlashingRecord> InMemoryConsensusRecords::evidenceLog() const {
    std::shared_lock lock{mutex_};
    return evidence_;
  }

  outcome::result<void> InMemoryConsensusRecords::putSnapshot(
      const ValidatorSetSnapshot &snapshot) {
    std::unique_lock lock{mutex_};
    auto [it, inserted] = snapshots_.try_emplace(snapshot.epoch, snapshot);
    if (not inserted and it->second.seed != snapshot.seed) {
      return ConsensusRecordsError::ALREADY_RECORDED;
    }
    return outcome::success();
  }

  std::optional<ValidatorSetSnapshot> InMemoryConsensusRecords::snapshotAt(
      Epoch epoch) const {
    std::shared_lock lock{mutex_};
    if (auto it = snapshots_.find(epoch); it != snapshots_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

}  // namespace keel
