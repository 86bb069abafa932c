/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <shared_mutex>
#include <unordered_map>

#include "blockchain/consensus_records.hpp"

namespace keel {

  class InMemoryConsensusRecords : public ConsensusRecords {
   public:
    outcome::result<void> putFinalized(
        const FinalizedBlock &finalized) override;
    std::optional<FinalizedBlock> finalizedAt(Height height) const override;

    outcome::result<void> putCheckpoint(const Checkpoint &checkpoint) override;
    std::optional<Checkpoint> checkpointAt(Height height) const override;

    outcome::result<void> putEvidence(const SlashingRecord &record) override;
    std::optional<SlashingRecord> evidence(
        const Hash256 &evidence_hash) const override;
    std::vector<SlashingRecord> evidenceLog() const override;

    outcome::result<void> putSnapshot(
        const ValidatorSetSnapshot &snapshot) override;
    std::optional<ValidatorSetSnapshot> snapshotAt(Epoch epoch) const override;

   private:
    mutable std::shared_mutex mutex_;
    std::map<Height, FinalizedBlock> finalized_;
    std::map<Height, Checkpoint> checkpoints_;
    std::unordered_map<Hash256, size_t> evidence_index_;
    std::vector<SlashingRecord> evidence_;
    std::map<Epoch, ValidatorSetSnapshot> snapshots_;
  };

}  // namespace keel
