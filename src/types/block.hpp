/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/byte_vec.hpp>

#include "crypto/sha/sha256.hpp"
#include "log/formatters/block_index_ref.hpp"
#include "serde/serialization.hpp"
#include "types/slashing_evidence.hpp"
#include "types/validator.hpp"
#include "types/vote.hpp"

namespace keel {

  /**
   * @struct BlockHeader
   * Everything a block commits to. Hash of header is the block hash.
   */
  struct BlockHeader : ssz::ssz_container {
    /// Hash of the parent block
    BlockHash parent_hash;
    Height height = 0;
    Slot slot = 0;
    /// Leader attempt inside the slot
    Round round = 0;
    /// Commitment to the post-state
    StateRoot state_root;
    ValidatorId proposer;
    TimestampMs timestamp = 0;
    /// SHA-256 of the payload
    BodyRoot body_root;

    SSZ_CONT(parent_hash,
             height,
             slot,
             round,
             state_root,
             proposer,
             timestamp,
             body_root);

    bool operator==(const BlockHeader &) const = default;

    BlockHash hash() const {
      return sszHash(*this);
    }
  };

  /**
   * Commitment to the block body. Payload hash is folded with every carried
   * attestation and evidence, so a body with neither hashes to SHA-256 of
   * the payload.
   */
  inline BodyRoot bodyRootOf(
      qtils::ByteView payload,
      const std::vector<SignedVote> &attestations = {},
      const std::vector<SlashingEvidence> &evidence = {}) {
    auto root = crypto::sha256(payload);
    for (auto &vote : attestations) {
      root = crypto::sha256Concat({root, sszHash(vote)});
    }
    for (auto &item : evidence) {
      root = crypto::sha256Concat({root, item.commitment()});
    }
    return root;
  }

  /// State commitment chain of produced blocks
  inline StateRoot nextStateRoot(const StateRoot &parent_state_root,
                                 const BodyRoot &body_root) {
    return crypto::sha256Concat({parent_state_root, body_root});
  }

  /**
   * Block with opaque payload, signed by proposer over header hash.
   * Attestations are commit votes for the parent block, evidence is
   * signed misbehavior proofs. Both are committed by `body_root`.
   */
  struct Block {
    BlockHeader header;
    qtils::ByteVec payload;
    std::vector<SignedVote> attestations;
    std::vector<SlashingEvidence> evidence;
    crypto::ed25519::Signature signature;

    BodyRoot bodyRoot() const {
      return bodyRootOf(payload, attestations, evidence);
    }

    bool operator==(const Block &) const = default;

    BlockHash hash() const {
      return header.hash();
    }
  };

}  // namespace keel

template <>
struct fmt::formatter<keel::BlockHeader>
    : fmt::formatter<keel::BlockIndexRef> {
  template <typename FormatContext>
  auto format(const keel::BlockHeader &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    auto hash = v.hash();
    return fmt::formatter<keel::BlockIndexRef>::format(
        keel::BlockIndexRef{v.height, hash}, ctx);
  }
};
