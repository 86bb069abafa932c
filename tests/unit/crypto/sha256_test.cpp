/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <gtest/gtest.h>
#include <qtils/unhex.hpp>

using keel::Hash256;

Hash256 fromHex(std::string_view hex) {
  Hash256 hash;
  EXPECT_TRUE(qtils::unhex0x(hash, hex, true).has_value());
  return hash;
}

/**
 * @given NIST test strings
 * @when hashing them
 * @then digests match published values
 */
TEST(Sha256Test, KnownVectors) {
  EXPECT_EQ(keel::crypto::sha256(""),
            fromHex("0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b"
                    "7852b855"));
  EXPECT_EQ(keel::crypto::sha256("abc"),
            fromHex("0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61"
                    "f20015ad"));
}

/**
 * @given chunks of a message
 * @when hashing their concatenation chunk by chunk
 * @then digest equals digest of joined message
 */
TEST(Sha256Test, ConcatEqualsJoined) {
  std::string_view a = "ab";
  std::string_view b = "c";
  qtils::ByteVec va;
  va.insert(va.end(), a.begin(), a.end());
  qtils::ByteVec vb;
  vb.insert(vb.end(), b.begin(), b.end());
  EXPECT_EQ(keel::crypto::sha256Concat({va, vb}), keel::crypto::sha256("abc"));
}
