/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "blockchain/validator_registry.hpp"
#include "log/logger.hpp"
#include "types/config.hpp"

namespace keel {
  class ConsensusRecords;
  class StakeTreasury;
}  // namespace keel

namespace keel {

  /**
   * Validator registry reading stakes from StakeTreasury.
   *
   * Rotation order: descending stake, ties by ascending public key bytes.
   * First `max_validators` become active, the rest are queued. Validators
   * ejected once never come back. Epoch seed is
   * `SHA-256(previous_seed || epoch || randomness)`.
   *
   * Epoch 0 is rotated in constructor with zero randomness.
   */
  class ValidatorRegistryImpl : public ValidatorRegistry {
   public:
    ValidatorRegistryImpl(qtils::SharedRef<log::LoggingSystem> logging_system,
                          qtils::SharedRef<StakeTreasury> treasury,
                          qtils::SharedRef<ConsensusRecords> records,
                          const ConsensusConfig &config);

    // ValidatorRegistry
    outcome::result<SetDelta> rotate(Epoch epoch,
                                     const BlockHash &randomness) override;
    outcome::result<Amount> applySlash(const ValidatorId &validator,
                                       Amount amount,
                                       SlashSeverity severity) override;
    void recordParticipation(const ValidatorId &validator, bool voted) override;
    SnapshotPtr current() const override;
    SnapshotPtr snapshotFor(Epoch epoch) const override;
    std::optional<Validator> validator(
        const ValidatorId &validator) const override;
    VotingPower votingPower(const ValidatorId &validator) const override;
    bool isEligible(const ValidatorId &validator) const override;
    VotingPower totalPower() const override;
    SubscriptionId onSetChange(SetChangeHandler handler) override;
    void removeSetChangeHandler(SubscriptionId id) override;

   private:
    log::Logger logger_;
    qtils::SharedRef<StakeTreasury> treasury_;
    qtils::SharedRef<ConsensusRecords> records_;
    Amount min_stake_;
    Amount stake_per_power_unit_;
    size_t max_validators_;

    std::map<ValidatorId, Validator> validators_;
    std::map<Epoch, SnapshotPtr> snapshots_;
    SnapshotPtr current_;
    std::map<SubscriptionId, SetChangeHandler> handlers_;
    SubscriptionId next_subscription_ = 0;
  };

}  // namespace keel
