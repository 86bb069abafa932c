/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519.hpp"

#include <gtest/gtest.h>

#include "blockchain/genesis_config.hpp"
#include "crypto/sha/sha256.hpp"

namespace ed25519 = keel::crypto::ed25519;

class Ed25519Test : public testing::Test {
 protected:
  ed25519::KeyPair keypair =
      ed25519::keypairFromSeed(keel::seedFromString("alice"));
  keel::Hash256 message = keel::crypto::sha256("message");
};

/**
 * @given keypair derived from seed
 * @when deriving it again from same seed
 * @then same public key is produced
 */
TEST_F(Ed25519Test, KeypairIsDeterministic) {
  auto again = ed25519::keypairFromSeed(keel::seedFromString("alice"));
  EXPECT_EQ(ed25519::publicKey(keypair), ed25519::publicKey(again));
  auto other = ed25519::keypairFromSeed(keel::seedFromString("bob"));
  EXPECT_NE(ed25519::publicKey(keypair), ed25519::publicKey(other));
}

/**
 * @given signature over message
 * @when verifying it with signer key
 * @then verification succeeds
 */
TEST_F(Ed25519Test, SignVerify) {
  auto signature = ed25519::sign(keypair, message);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(ed25519::verify(*signature, message, ed25519::publicKey(keypair)));
}

/**
 * @given signature over message
 * @when verifying it against another message or another key
 * @then verification fails
 */
TEST_F(Ed25519Test, VerifyRejectsForeignMessageAndKey) {
  auto signature = ed25519::sign(keypair, message);
  ASSERT_TRUE(signature.has_value());
  auto other_message = keel::crypto::sha256("other");
  EXPECT_FALSE(
      ed25519::verify(*signature, other_message, ed25519::publicKey(keypair)));
  auto other = ed25519::keypairFromSeed(keel::seedFromString("bob"));
  EXPECT_FALSE(ed25519::verify(*signature, message, ed25519::publicKey(other)));
}
