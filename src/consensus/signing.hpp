/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "crypto/ed25519.hpp"
#include "types/block.hpp"
#include "types/checkpoint.hpp"
#include "types/vote.hpp"

namespace keel::consensus {

  enum class SigningError {
    SIGNING_FAILED = 1,
  };
  Q_ENUM_ERROR_CODE(SigningError) {
    using E = decltype(e);
    switch (e) {
      case E::SIGNING_FAILED:
        return "ed25519 signing failed";
    }
    abort();
  }

  // Every signature covers the 32-byte SSZ root of the signed message

  inline outcome::result<crypto::ed25519::Signature> signRoot(
      const crypto::ed25519::KeyPair &keypair, const Hash256 &root) {
    auto signature = crypto::ed25519::sign(keypair, root);
    if (not signature) {
      return SigningError::SIGNING_FAILED;
    }
    return signature.value();
  }

  inline outcome::result<SignedVote> signVote(
      const crypto::ed25519::KeyPair &keypair, Vote vote) {
    BOOST_OUTCOME_TRY(auto signature, signRoot(keypair, sszHash(vote)));
    return SignedVote{.data = std::move(vote), .signature = signature};
  }

  inline bool verifyVote(const SignedVote &vote) {
    return crypto::ed25519::verify(
        vote.signature, sszHash(vote.data), vote.data.validator);
  }

  inline outcome::result<Block> signBlock(
      const crypto::ed25519::KeyPair &keypair,
      BlockHeader header,
      qtils::ByteVec payload,
      std::vector<SignedVote> attestations = {},
      std::vector<SlashingEvidence> evidence = {}) {
    BOOST_OUTCOME_TRY(auto signature, signRoot(keypair, header.hash()));
    return Block{
        .header = std::move(header),
        .payload = std::move(payload),
        .attestations = std::move(attestations),
        .evidence = std::move(evidence),
        .signature = signature,
    };
  }

  inline bool verifyBlock(const Block &block) {
    return crypto::ed25519::verify(
        block.signature, block.hash(), block.header.proposer);
  }

  inline outcome::result<CheckpointSignature> signCheckpoint(
      const crypto::ed25519::KeyPair &keypair, CheckpointMessage message) {
    BOOST_OUTCOME_TRY(auto signature, signRoot(keypair, sszHash(message)));
    return CheckpointSignature{
        .validator = crypto::ed25519::publicKey(keypair),
        .message = std::move(message),
        .signature = signature,
    };
  }

  inline bool verifyCheckpointSignature(const CheckpointSignature &signature) {
    return crypto::ed25519::verify(signature.signature,
                                   sszHash(signature.message),
                                   signature.validator);
  }

}  // namespace keel::consensus
