/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/leader_scheduler.hpp"

#include <algorithm>

#include "crypto/sha/sha256.hpp"
#include "utils/le_bytes.hpp"

namespace keel {

  LeaderScheduler::LeaderScheduler(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<ValidatorRegistry> validator_registry,
      const ConsensusConfig &config)
      : logger_{logging_system->getLogger("LeaderScheduler", "leader")},
        validator_registry_{std::move(validator_registry)},
        slots_per_epoch_{std::max<Slot>(config.slots_per_epoch, 1)},
        policy_{config.leader_policy},
        backup_count_{config.backup_count},
        leader_timeout_ms_{std::max<uint64_t>(config.leader_timeout_ms, 1)} {
    auto snapshot = validator_registry_->current();
    cumulative_.emplace(snapshot->epoch, cumulativeWeights(*snapshot));
    subscription_ = validator_registry_->onSetChange(
        [this](const ValidatorSetSnapshot &snapshot, const SetDelta &delta) {
          onSetChange(snapshot, delta);
        });
  }

  LeaderScheduler::~LeaderScheduler() {
    validator_registry_->removeSetChangeHandler(subscription_);
  }

  void LeaderScheduler::onSetChange(const ValidatorSetSnapshot &snapshot,
                                    const SetDelta &delta) {
    cumulative_.insert_or_assign(snapshot.epoch, cumulativeWeights(snapshot));
    // Schedules of past epochs are still needed to validate late blocks
    while (cumulative_.size() > 2) {
      cumulative_.erase(cumulative_.begin());
    }
    SL_DEBUG(logger_,
             "Schedule for epoch {} updated: {} leaders, {} joined, {} left",
             snapshot.epoch,
             snapshot.active_count,
             delta.added.size(),
             delta.removed.size());
  }

  std::vector<VotingPower> LeaderScheduler::cumulativeWeights(
      const ValidatorSetSnapshot &snapshot) {
    std::vector<VotingPower> cumulative;
    cumulative.reserve(snapshot.active_count);
    VotingPower sum = 0;
    for (auto &validator : snapshot.active()) {
      sum += validator.voting_power;
      cumulative.emplace_back(sum);
    }
    return cumulative;
  }

  ValidatorId LeaderScheduler::selectRoundRobin(
      const ValidatorSetSnapshot &snapshot, Slot slot, uint64_t attempt) {
    auto index = (slot + attempt) % snapshot.active_count;
    return snapshot.validators[index].id;
  }

  ValidatorId LeaderScheduler::selectStakeWeighted(
      const ValidatorSetSnapshot &snapshot,
      const std::vector<VotingPower> &cumulative,
      Slot slot,
      uint64_t attempt) {
    auto total = cumulative.back();
    auto digest = crypto::sha256Concat(
        {snapshot.seed, leBytes(slot), leBytes(attempt)});
    auto r = leU64(digest) % total;
    return snapshot.validators[drawIndex(cumulative, r)].id;
  }

  size_t LeaderScheduler::drawIndex(const std::vector<VotingPower> &cumulative,
                                    VotingPower draw) {
    auto it = std::ranges::upper_bound(cumulative, draw);
    return std::distance(cumulative.begin(), it);
  }

  outcome::result<ValidatorRegistry::SnapshotPtr> LeaderScheduler::snapshotOf(
      Slot slot) const {
    auto epoch = slot / slots_per_epoch_;
    if (epoch > validator_registry_->current()->epoch) {
      return Error::EPOCH_NOT_STARTED;
    }
    auto snapshot = validator_registry_->snapshotFor(epoch);
    if (snapshot->active_count == 0 or snapshot->total_power == 0) {
      return Error::NO_ACTIVE_VALIDATORS;
    }
    return snapshot;
  }

  ValidatorId LeaderScheduler::select(const ValidatorSetSnapshot &snapshot,
                                      Slot slot,
                                      uint64_t attempt) const {
    switch (policy_) {
      case LeaderPolicy::RoundRobin:
        break;
      case LeaderPolicy::StakeWeighted: {
        if (auto it = cumulative_.find(snapshot.epoch);
            it != cumulative_.end()) {
          return selectStakeWeighted(snapshot, it->second, slot, attempt);
        }
        return selectStakeWeighted(
            snapshot, cumulativeWeights(snapshot), slot, attempt);
      }
    }
    return selectRoundRobin(snapshot, slot, attempt);
  }

  outcome::result<ValidatorId> LeaderScheduler::leaderFor(Slot slot) const {
    return leaderForAttempt(slot, 0);
  }

  outcome::result<ValidatorId> LeaderScheduler::leaderForAttempt(
      Slot slot, uint64_t attempt) const {
    BOOST_OUTCOME_TRY(auto snapshot, snapshotOf(slot));
    return select(*snapshot, slot, attempt);
  }

  outcome::result<std::vector<ValidatorId>> LeaderScheduler::backupsFor(
      Slot slot) const {
    BOOST_OUTCOME_TRY(auto snapshot, snapshotOf(slot));
    auto leader = select(*snapshot, slot, 0);

    std::vector<ValidatorId> backups;
    auto wanted = std::min(backup_count_, snapshot->active_count - 1);
    // Weighted draws repeat, bound the search
    auto max_attempts = (backup_count_ + snapshot->active_count) * 8;
    for (uint64_t attempt = 1;
         backups.size() < wanted and attempt <= max_attempts;
         ++attempt) {
      auto candidate = select(*snapshot, slot, attempt);
      if (candidate == leader or std::ranges::count(backups, candidate) != 0) {
        continue;
      }
      backups.emplace_back(candidate);
    }
    return backups;
  }

  outcome::result<std::vector<ValidatorId>> LeaderScheduler::scheduleFor(
      Slot slot) const {
    BOOST_OUTCOME_TRY(auto leader, leaderFor(slot));
    BOOST_OUTCOME_TRY(auto backups, backupsFor(slot));
    std::vector<ValidatorId> schedule;
    schedule.reserve(backups.size() + 1);
    schedule.emplace_back(leader);
    schedule.insert(schedule.end(), backups.begin(), backups.end());
    return schedule;
  }

  outcome::result<ValidatorId> LeaderScheduler::proposerFor(Slot slot,
                                                            Round round) const {
    BOOST_OUTCOME_TRY(auto schedule, scheduleFor(slot));
    if (round >= schedule.size()) {
      return Error::NO_PROPOSER_FOR_ROUND;
    }
    return schedule[round];
  }

  Round LeaderScheduler::attemptAt(uint64_t elapsed_ms) const {
    return std::min<Round>(elapsed_ms / leader_timeout_ms_, backup_count_);
  }

}  // namespace keel
