/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "blockchain/consensus_records.hpp"

namespace keel {
  class ConsensusRecordsMock : public ConsensusRecords {
   public:
    MOCK_METHOD(outcome::result<void>,
                putFinalized,
                (const FinalizedBlock &),
                (override));
    MOCK_METHOD(std::optional<FinalizedBlock>,
                finalizedAt,
                (Height),
                (const, override));
    MOCK_METHOD(outcome::result<void>,
                putCheckpoint,
                (const Checkpoint &),
                (override));
    MOCK_METHOD(std::optional<Checkpoint>,
                checkpointAt,
                (Height),
                (const, override));
    MOCK_METHOD(outcome::result<void>,
                putEvidence,
                (const SlashingRecord &),
                (override));
    MOCK_METHOD(std::optional<SlashingRecord>,
                evidence,
                (const Hash256 &),
                (const, override));
    MOCK_METHOD(std::vector<SlashingRecord>,
                evidenceLog,
                (),
                (const, override));
    MOCK_METHOD(outcome::result<void>,
                putSnapshot,
                (const ValidatorSetSnapshot &),
                (override));
    MOCK_METHOD(std::optional<ValidatorSetSnapshot>,
                snapshotAt,
                (Epoch),
                (const, override));
  };
}  // namespace keel
