/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/config.hpp"

namespace keel::consensus {

  /**
   * Stake-weighted supermajority check.
   * `reached(power, total)` is `power * den >= total * num`, evaluated
   * without division so that result depends only on summed power.
   */
  class Quorum {
   public:
    enum class Error {
      INVALID_THRESHOLD = 1,
      THRESHOLD_BELOW_FAULT_BOUND,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::INVALID_THRESHOLD:
          return "Quorum threshold must be a fraction in (0, 1]";
        case E::THRESHOLD_BELOW_FAULT_BOUND:
          return "Quorum threshold below 2/3 breaks Byzantine fault bound";
      }
      abort();
    }

    static outcome::result<Quorum> create(QuorumThreshold threshold) {
      if (threshold.denominator == 0 or threshold.numerator == 0
          or threshold.numerator > threshold.denominator) {
        return Error::INVALID_THRESHOLD;
      }
      if (threshold.numerator * 3 < threshold.denominator * 2) {
        return Error::THRESHOLD_BELOW_FAULT_BOUND;
      }
      return Quorum{threshold};
    }

    /// Minimal power reaching quorum of total
    VotingPower requiredPower(VotingPower total) const {
      auto scaled = total * threshold_.numerator;
      return (scaled + threshold_.denominator - 1) / threshold_.denominator;
    }

    bool reached(VotingPower power, VotingPower total) const {
      if (total == 0) {
        return false;
      }
      return power * threshold_.denominator >= total * threshold_.numerator;
    }

    const QuorumThreshold &threshold() const {
      return threshold_;
    }

   private:
    explicit Quorum(QuorumThreshold threshold) : threshold_{threshold} {}

    QuorumThreshold threshold_;
  };

}  // namespace keel::consensus
