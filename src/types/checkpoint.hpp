/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "log/formatters/block_index_ref.hpp"
#include "serde/serialization.hpp"
#include "types/validator.hpp"

namespace keel {

  /// Message every validator signs for a checkpoint block
  struct CheckpointMessage : ssz::ssz_container {
    Height height = 0;
    BlockHash block_hash;

    SSZ_CONT(height, block_hash);

    bool operator==(const CheckpointMessage &) const = default;
  };

  struct CheckpointSignature {
    ValidatorId validator;
    CheckpointMessage message;
    crypto::ed25519::Signature signature;

    bool operator==(const CheckpointSignature &) const = default;
  };

  /**
   * Sealed checkpoint: block at interval height signed by quorum.
   */
  struct Checkpoint {
    Height height = 0;
    BlockHash block_hash;
    StateRoot state_root;
    std::vector<CheckpointSignature> signatures;
    VotingPower power = 0;

    bool operator==(const Checkpoint &) const = default;
  };

}  // namespace keel

template <>
struct fmt::formatter<keel::Checkpoint> : fmt::formatter<keel::BlockIndexRef> {
  template <typename FormatContext>
  auto format(const keel::Checkpoint &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<keel::BlockIndexRef>::format(
        keel::BlockIndexRef{v.height, v.block_hash}, ctx);
  }
};
