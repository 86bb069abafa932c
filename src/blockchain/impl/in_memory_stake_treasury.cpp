/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/in_memory_stake_treasury.hpp"

#include <algorithm>
#include <mutex>

namespace keel {

  InMemoryStakeTreasury::InMemoryStakeTreasury(
      std::map<ValidatorId, Amount> stakes)
      : stakes_{std::move(stakes)} {}

  void InMemoryStakeTreasury::deposit(const ValidatorId &validator,
                                      Amount amount) {
    std::unique_lock lock{mutex_};
    stakes_[validator] += amount;
  }

  std::vector<ValidatorId> InMemoryStakeTreasury::stakeholders() const {
    std::shared_lock lock{mutex_};
    std::vector<ValidatorId> ids;
    ids.reserve(stakes_.size());
    for (auto &[id, _] : stakes_) {
      ids.emplace_back(id);
    }
    return ids;
  }

  Amount InMemoryStakeTreasury::currentStake(
      const ValidatorId &validator) const {
    std::shared_lock lock{mutex_};
    auto it = stakes_.find(validator);
    return it != stakes_.end() ? it->second : 0;
  }

  void InMemoryStakeTreasury::applyReward(const RewardMap &rewards) {
    std::unique_lock lock{mutex_};
    for (auto &[id, amount] : rewards) {
      stakes_[id] += amount;
    }
  }

  void InMemoryStakeTreasury::applyPenalty(const ValidatorId &validator,
                                           Amount amount) {
    std::unique_lock lock{mutex_};
    auto it = stakes_.find(validator);
    if (it == stakes_.end()) {
      return;
    }
    auto deducted = std::min(amount, it->second);
    it->second -= deducted;
    burned_ += deducted;
  }

  Amount InMemoryStakeTreasury::burned() const {
    std::shared_lock lock{mutex_};
    return burned_;
  }

}  // namespace keel
