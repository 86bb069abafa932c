/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/formatters/block_index_ref.hpp"
#include "serde/serialization.hpp"
#include "types/validator.hpp"

namespace keel {

  enum class VotePhase : uint8_t {
    Prepare = 0,
    Commit = 1,
  };

  struct Vote : ssz::ssz_container {
    ValidatorId validator;
    BlockHash block_hash;
    Height height = 0;
    Round round = 0;
    uint8_t phase_tag = 0;

    SSZ_CONT(validator, block_hash, height, round, phase_tag);

    bool operator==(const Vote &) const = default;

    VotePhase phase() const {
      return static_cast<VotePhase>(phase_tag);
    }

    static Vote make(const ValidatorId &validator,
                     const BlockHash &block_hash,
                     Height height,
                     Round round,
                     VotePhase phase) {
      return Vote{
          .validator = validator,
          .block_hash = block_hash,
          .height = height,
          .round = round,
          .phase_tag = static_cast<uint8_t>(phase),
      };
    }
  };

  struct SignedVote : ssz::ssz_container {
    Vote data;
    crypto::ed25519::Signature signature;

    SSZ_CONT(data, signature);

    bool operator==(const SignedVote &) const = default;
  };

}  // namespace keel

template <>
struct fmt::formatter<keel::VotePhase> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(keel::VotePhase v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        v == keel::VotePhase::Commit ? "commit" : "prepare", ctx);
  }
};

template <>
struct fmt::formatter<keel::Vote> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const keel::Vote &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "{} by {:0x} for {} round {}",
                          v.phase(),
                          v.validator,
                          keel::BlockIndexRef{v.height, v.block_hash},
                          v.round);
  }
};
