/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include <fmt/format.h>
#include <qtils/byte_arr.hpp>

#include "crypto/ed25519.hpp"
#include "crypto/sha/sha256.hpp"
#include "types/constants.hpp"
#include "types/slot.hpp"

namespace keel {

  /// Validator identity is its ed25519 public key
  using ValidatorId = crypto::ed25519::Public;
  using Address = qtils::ByteArr<ADDRESS_SIZE>;

  enum class ValidatorStatus : uint8_t {
    Active,
    Queued,
    Ejected,
  };

  /// Address is the first 20 bytes of SHA-256 of the public key
  inline Address addressOf(const ValidatorId &id) {
    auto digest = crypto::sha256(id);
    Address address;
    std::copy_n(digest.begin(), address.size(), address.begin());
    return address;
  }

  struct Validator {
    ValidatorId id;
    Address address;
    Amount stake = 0;
    VotingPower voting_power = 0;
    ValidatorStatus status = ValidatorStatus::Queued;

    /// Performance counters
    uint64_t votes_cast = 0;
    uint64_t votes_missed = 0;
    uint64_t consecutive_missed = 0;

    bool operator==(const Validator &) const = default;
  };

}  // namespace keel

template <>
struct fmt::formatter<keel::ValidatorStatus> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(keel::ValidatorStatus v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    std::string_view name = "?";
    switch (v) {
      case keel::ValidatorStatus::Active:
        name = "active";
        break;
      case keel::ValidatorStatus::Queued:
        name = "queued";
        break;
      case keel::ValidatorStatus::Ejected:
        name = "ejected";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
