/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/block_hash.hpp"
#include "types/validator_set.hpp"

namespace keel {

  enum class SlashSeverity : uint8_t {
    /// Stake is reduced, status changes only below minimal stake
    Minor,
    /// Validator is ejected at once
    Severe,
  };

  /**
   * Authoritative mapping from validator identity to stake, voting power and
   * status. Voting power used for quorums comes from the frozen snapshot of
   * the current epoch.
   */
  class ValidatorRegistry {
   public:
    using SnapshotPtr = std::shared_ptr<const ValidatorSetSnapshot>;
    using SetChangeHandler =
        std::function<void(const ValidatorSetSnapshot &, const SetDelta &)>;
    using SubscriptionId = uint64_t;

    enum class Error {
      UNKNOWN_VALIDATOR = 1,
      EPOCH_NOT_ADVANCING,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::UNKNOWN_VALIDATOR:
          return "Unknown validator";
        case E::EPOCH_NOT_ADVANCING:
          return "Rotation epoch is not above current one";
      }
      abort();
    }

    virtual ~ValidatorRegistry() = default;

    /**
     * Recomputes active set from stake source and freezes it for epoch.
     * @param randomness latest finalized block hash, mixed into epoch seed
     * @return changes against previous active set
     */
    virtual outcome::result<SetDelta> rotate(Epoch epoch,
                                             const BlockHash &randomness) = 0;

    /**
     * Deducts stake, clamping at zero.
     * @return remaining stake
     */
    virtual outcome::result<Amount> applySlash(const ValidatorId &validator,
                                               Amount amount,
                                               SlashSeverity severity) = 0;

    virtual void recordParticipation(const ValidatorId &validator,
                                     bool voted) = 0;

    [[nodiscard]] virtual SnapshotPtr current() const = 0;

    /// Latest snapshot with epoch not above given one
    [[nodiscard]] virtual SnapshotPtr snapshotFor(Epoch epoch) const = 0;

    [[nodiscard]] virtual std::optional<Validator> validator(
        const ValidatorId &validator) const = 0;

    /// Voting power in current epoch, zero for non-active validators
    [[nodiscard]] virtual VotingPower votingPower(
        const ValidatorId &validator) const = 0;

    /// Active in current epoch and not ejected
    [[nodiscard]] virtual bool isEligible(
        const ValidatorId &validator) const = 0;

    [[nodiscard]] virtual VotingPower totalPower() const = 0;

    /// @return id to unsubscribe with
    virtual SubscriptionId onSetChange(SetChangeHandler handler) = 0;

    virtual void removeSetChangeHandler(SubscriptionId id) = 0;
  };

}  // namespace keel
