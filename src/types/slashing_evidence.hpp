/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "crypto/sha/sha256.hpp"
#include "types/vote.hpp"
#include "utils/le_bytes.hpp"

namespace keel {

  enum class Offense : uint8_t {
    DoubleSign = 1,
    LongRangeEquivocation = 2,
    Unavailability = 3,
  };

  /**
   * Proof of misbehavior.
   * Signed offenses carry both conflicting votes, unavailability carries the
   * number of consecutive missed votes.
   */
  struct SlashingEvidence {
    Offense offense = Offense::DoubleSign;
    ValidatorId offender;
    Height height = 0;
    Round round = 0;
    Epoch epoch = 0;
    std::optional<SignedVote> first;
    std::optional<SignedVote> second;
    uint64_t consecutive_missed = 0;

    bool operator==(const SlashingEvidence &) const = default;

    bool isSigned() const {
      return offense != Offense::Unavailability;
    }

    /// Identity used for de-duplication, independent of vote order
    Hash256 hash() const {
      std::array<uint8_t, 1> tag{static_cast<uint8_t>(offense)};
      if (isSigned() and first and second) {
        auto a = sszHash(first->data);
        auto b = sszHash(second->data);
        if (b < a) {
          std::swap(a, b);
        }
        return crypto::sha256Concat({tag, a, b});
      }
      return crypto::sha256Concat(
          {tag, offender, leBytes(epoch), leBytes(consecutive_missed)});
    }

    /// Identity together with the signatures, committed by carrying block
    Hash256 commitment() const {
      if (isSigned() and first and second) {
        return crypto::sha256Concat(
            {hash(), sszHash(*first), sszHash(*second)});
      }
      return hash();
    }
  };

  struct SlashingRecord {
    Hash256 evidence_hash;
    SlashingEvidence evidence;
    Amount penalty = 0;
    Amount stake_after = 0;
    Height processed_at = 0;
  };

}  // namespace keel

template <>
struct fmt::formatter<keel::Offense> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(keel::Offense v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    std::string_view name = "?";
    switch (v) {
      case keel::Offense::DoubleSign:
        name = "double-sign";
        break;
      case keel::Offense::LongRangeEquivocation:
        name = "long-range equivocation";
        break;
      case keel::Offense::Unavailability:
        name = "unavailability";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
