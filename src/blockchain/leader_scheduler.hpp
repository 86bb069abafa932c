/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "blockchain/validator_registry.hpp"
#include "log/logger.hpp"
#include "types/config.hpp"
#include "types/validator_set.hpp"

namespace keel {

  /**
   * Assigns block production duty per slot.
   *
   * Attempt 0 of a slot is its leader; attempts 1, 2, ... produce the backup
   * list, which takes over one attempt per `leader_timeout_ms` when the
   * leader stays silent. Everything is derived from the frozen snapshot of
   * the slot's epoch, slots of epochs not rotated to yet have no schedule.
   */
  class LeaderScheduler {
   public:
    enum class Error {
      NO_ACTIVE_VALIDATORS = 1,
      NO_PROPOSER_FOR_ROUND,
      EPOCH_NOT_STARTED,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::NO_ACTIVE_VALIDATORS:
          return "No active validators to schedule";
        case E::NO_PROPOSER_FOR_ROUND:
          return "Round is beyond the backup list of slot";
        case E::EPOCH_NOT_STARTED:
          return "Validator set of slot epoch is not built yet";
      }
      abort();
    }

    LeaderScheduler(qtils::SharedRef<log::LoggingSystem> logging_system,
                    qtils::SharedRef<ValidatorRegistry> validator_registry,
                    const ConsensusConfig &config);
    ~LeaderScheduler();

    LeaderScheduler(const LeaderScheduler &) = delete;
    LeaderScheduler &operator=(const LeaderScheduler &) = delete;

    outcome::result<ValidatorId> leaderFor(Slot slot) const;

    outcome::result<ValidatorId> leaderForAttempt(Slot slot,
                                                  uint64_t attempt) const;

    /// Next `backup_count` distinct candidates after leader
    outcome::result<std::vector<ValidatorId>> backupsFor(Slot slot) const;

    /// Leader followed by backups, indexed by round
    outcome::result<std::vector<ValidatorId>> scheduleFor(Slot slot) const;

    /// Validator expected to propose in given round of slot
    outcome::result<ValidatorId> proposerFor(Slot slot, Round round) const;

    /// Round in effect after `elapsed_ms` since slot start
    Round attemptAt(uint64_t elapsed_ms) const;

    static ValidatorId selectRoundRobin(const ValidatorSetSnapshot &snapshot,
                                        Slot slot,
                                        uint64_t attempt);

    static ValidatorId selectStakeWeighted(
        const ValidatorSetSnapshot &snapshot,
        const std::vector<VotingPower> &cumulative,
        Slot slot,
        uint64_t attempt);

    /// Prefix sums of active voting power in snapshot order
    static std::vector<VotingPower> cumulativeWeights(
        const ValidatorSetSnapshot &snapshot);

    /**
     * Index of first validator whose cumulative weight exceeds the draw, so
     * a draw equal to a boundary belongs to the upper sub-range
     * @param draw in [0, cumulative.back())
     */
    static size_t drawIndex(const std::vector<VotingPower> &cumulative,
                            VotingPower draw);

   private:
    outcome::result<ValidatorRegistry::SnapshotPtr> snapshotOf(
        Slot slot) const;

    ValidatorId select(const ValidatorSetSnapshot &snapshot,
                       Slot slot,
                       uint64_t attempt) const;

    void onSetChange(const ValidatorSetSnapshot &snapshot,
                     const SetDelta &delta);

    log::Logger logger_;
    qtils::SharedRef<ValidatorRegistry> validator_registry_;
    Slot slots_per_epoch_;
    LeaderPolicy policy_;
    size_t backup_count_;
    uint64_t leader_timeout_ms_;

    std::map<Epoch, std::vector<VotingPower>> cumulative_;
    ValidatorRegistry::SubscriptionId subscription_;
  };

}  // namespace keel
