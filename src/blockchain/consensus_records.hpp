/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/checkpoint.hpp"
#include "types/quorum_certificate.hpp"
#include "types/slashing_evidence.hpp"
#include "types/validator_set.hpp"

namespace keel {

  enum class ConsensusRecordsError {
    ALREADY_RECORDED = 1,
  };
  Q_ENUM_ERROR_CODE(ConsensusRecordsError) {
    using E = decltype(e);
    switch (e) {
      case E::ALREADY_RECORDED:
        return "Different record already stored under the same key";
    }
    abort();
  }

  /**
   * Persisted consensus state. Every table is append-only: writing the same
   * record twice succeeds, writing a different record under an existing key
   * fails with `ALREADY_RECORDED`.
   *
   * - finalized blocks by height
   * - checkpoints by height
   * - slashing evidence log by evidence hash
   * - validator set snapshots by epoch
   */
  class ConsensusRecords {
   public:
    virtual ~ConsensusRecords() = default;

    virtual outcome::result<void> putFinalized(
        const FinalizedBlock &finalized) = 0;
    [[nodiscard]] virtual std::optional<FinalizedBlock> finalizedAt(
        Height height) const = 0;

    virtual outcome::result<void> putCheckpoint(
        const Checkpoint &checkpoint) = 0;
    [[nodiscard]] virtual std::optional<Checkpoint> checkpointAt(
        Height height) const = 0;

    virtual outcome::result<void> putEvidence(const SlashingRecord &record) = 0;
    [[nodiscard]] virtual std::optional<SlashingRecord> evidence(
        const Hash256 &evidence_hash) const = 0;
    /// Evidence in processing order
    [[nodiscard]] virtual std::vector<SlashingRecord> evidenceLog() const = 0;

    virtual outcome::result<void> putSnapshot(
        const ValidatorSetSnapshot &snapshot) = 0;
    [[nodiscard]] virtual std::optional<ValidatorSetSnapshot> snapshotAt(
        Epoch epoch) const = 0;
  };

}  // namespace keel
