/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/validator_registry_impl.hpp"

#include <algorithm>
#include <ranges>

#include <qtils/error_throw.hpp>

#include "blockchain/consensus_records.hpp"
#include "blockchain/stake_treasury.hpp"
#include "crypto/sha/sha256.hpp"
#include "utils/le_bytes.hpp"

namespace keel {

  ValidatorRegistryImpl::ValidatorRegistryImpl(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<StakeTreasury> treasury,
      qtils::SharedRef<ConsensusRecords> records,
      const ConsensusConfig &config)
      : logger_{logging_system->getLogger("ValidatorRegistry", "validators")},
        treasury_{std::move(treasury)},
        records_{std::move(records)},
        min_stake_{config.min_stake},
        stake_per_power_unit_{std::max<Amount>(config.stake_per_power_unit, 1)},
        max_validators_{config.max_validators} {
    auto res = rotate(0, kZeroHash);
    if (res.has_error()) {
      qtils::raise(res.error());
    }
  }

  outcome::result<SetDelta> ValidatorRegistryImpl::rotate(
      Epoch epoch, const BlockHash &randomness) {
    if (current_ and epoch <= current_->epoch) {
      SL_WARN(logger_,
              "Rotation to epoch {} rejected, current epoch is {}",
              epoch,
              current_->epoch);
      return Error::EPOCH_NOT_ADVANCING;
    }

    auto records = validators_;

    std::vector<Validator> candidates;
    for (auto &id : treasury_->stakeholders()) {
      auto &record =
          records.try_emplace(id, Validator{.id = id, .address = addressOf(id)})
              .first->second;
      record.stake = treasury_->currentStake(id);
      if (record.status == ValidatorStatus::Ejected) {
        continue;
      }
      record.voting_power = record.stake / stake_per_power_unit_;
      if (record.stake < min_stake_ or record.voting_power == 0) {
        record.status = ValidatorStatus::Queued;
        continue;
      }
      candidates.emplace_back(record);
    }

    // Same inputs give same order on every node
    std::ranges::sort(candidates, [](const Validator &l, const Validator &r) {
      if (l.stake != r.stake) {
        return l.stake > r.stake;
      }
      return l.id < r.id;
    });

    for (auto &[_, record] : records) {
      if (record.status != ValidatorStatus::Ejected) {
        record.status = ValidatorStatus::Queued;
      }
    }

    auto snapshot = std::make_shared<ValidatorSetSnapshot>();
    snapshot->epoch = epoch;
    snapshot->active_count = std::min(candidates.size(), max_validators_);
    for (size_t i = 0; i < candidates.size(); ++i) {
      auto &record = records.at(candidates[i].id);
      if (i < snapshot->active_count) {
        record.status = ValidatorStatus::Active;
        snapshot->total_power += record.voting_power;
      }
      snapshot->validators.emplace_back(record);
    }
    auto previous_seed = current_ ? current_->seed : Hash256{};
    snapshot->seed =
        crypto::sha256Concat({previous_seed, leBytes(epoch), randomness});

    SetDelta delta{.epoch = epoch};
    for (auto &validator : snapshot->active()) {
      if (not current_ or not current_->isActive(validator.id)) {
        delta.added.emplace_back(validator.id);
      } else if (current_->powerOf(validator.id) != validator.voting_power) {
        delta.power_changed.emplace_back(validator.id);
      }
    }
    if (current_) {
      for (auto &validator : current_->active()) {
        if (not snapshot->isActive(validator.id)) {
          delta.removed.emplace_back(validator.id);
        }
      }
    }

    BOOST_OUTCOME_TRY(records_->putSnapshot(*snapshot));

    validators_ = std::move(records);
    snapshots_.emplace(epoch, snapshot);
    current_ = snapshot;

    SL_INFO(logger_,
            "Epoch {} validator set: {} active, {} queued, total power {}, "
            "seed {:0x}",
            epoch,
            snapshot->active_count,
            snapshot->validators.size() - snapshot->active_count,
            snapshot->total_power,
            snapshot->seed);
    SL_DEBUG(logger_,
             "Epoch {} delta: {} added, {} removed, {} power changed",
             epoch,
             delta.added.size(),
             delta.removed.size(),
             delta.power_changed.size());

    for (auto &handler : handlers_ | std::views::values) {
      handler(*snapshot, delta);
    }
    return delta;
  }

  outcome::result<Amount> ValidatorRegistryImpl::applySlash(
      const ValidatorId &validator, Amount amount, SlashSeverity severity) {
    auto it = validators_.find(validator);
    if (it == validators_.end()) {
      SL_WARN(logger_, "Slash of unknown validator {:0x}", validator);
      return Error::UNKNOWN_VALIDATOR;
    }
    auto &record = it->second;

    auto deducted = std::min(amount, record.stake);
    record.stake -= deducted;
    if (deducted > 0) {
      treasury_->applyPenalty(validator, deducted);
    }

    // Voting power stays as frozen in snapshot until next rotation
    if (record.status != ValidatorStatus::Ejected
        and (severity == SlashSeverity::Severe or record.stake < min_stake_)) {
      record.status = ValidatorStatus::Ejected;
      SL_WARN(logger_,
              "Validator {:0x} ejected, remaining stake {}",
              validator,
              record.stake);
    }

    SL_INFO(logger_,
            "Validator {:0x} slashed by {}, stake {} -> {}",
            validator,
            deducted,
            record.stake + deducted,
            record.stake);
    return record.stake;
  }

  void ValidatorRegistryImpl::recordParticipation(const ValidatorId &validator,
                                                  bool voted) {
    auto it = validators_.find(validator);
    if (it == validators_.end()) {
      return;
    }
    auto &record = it->second;
    if (voted) {
      ++record.votes_cast;
      record.consecutive_missed = 0;
    } else {
      ++record.votes_missed;
      ++record.consecutive_missed;
    }
  }

  ValidatorRegistry::SnapshotPtr ValidatorRegistryImpl::current() const {
    return current_;
  }

  ValidatorRegistry::SnapshotPtr ValidatorRegistryImpl::snapshotFor(
      Epoch epoch) const {
    auto it = snapshots_.upper_bound(epoch);
    if (it == snapshots_.begin()) {
      return current_;
    }
    return std::prev(it)->second;
  }

  std::optional<Validator> ValidatorRegistryImpl::validator(
      const ValidatorId &validator) const {
    if (auto it = validators_.find(validator); it != validators_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  VotingPower ValidatorRegistryImpl::votingPower(
      const ValidatorId &validator) const {
    return current_->powerOf(validator);
  }

  bool ValidatorRegistryImpl::isEligible(const ValidatorId &validator) const {
    if (not current_->isActive(validator)) {
      return false;
    }
    auto it = validators_.find(validator);
    return it != validators_.end()
       and it->second.status != ValidatorStatus::Ejected;
  }

  VotingPower ValidatorRegistryImpl::totalPower() const {
    return current_->total_power;
  }

  ValidatorRegistry::SubscriptionId ValidatorRegistryImpl::onSetChange(
      SetChangeHandler handler) {
    auto id = next_subscription_++;
    handlers_.emplace(id, std::move(handler));
    return id;
  }

  void ValidatorRegistryImpl::removeSetChangeHandler(SubscriptionId id) {
    handlers_.erase(id);
  }

}  // namespace keel
