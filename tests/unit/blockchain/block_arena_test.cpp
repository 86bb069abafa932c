/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/block_arena.hpp"

#include <gtest/gtest.h>

#include "testutil/chain_builder.hpp"

using keel::BlockArena;

class BlockArenaTest : public testing::Test {
 protected:
  void SetUp() override {
    genesis = testutil::makeGenesis({{"alice", 10}}).genesisBlock();
    auto alice = testutil::keypairOf("alice");
    // genesis <- a1 <- a2
    //         <- b1
    a1 = testutil::makeChild(genesis, alice, 1, 0, "a");
    a2 = testutil::makeChild(a1, alice, 2);
    b1 = testutil::makeChild(genesis, alice, 1, 0, "b");
    for (auto &block : {genesis, a1, a2, b1}) {
      ASSERT_TRUE(arena.insert(block));
    }
  }

  BlockArena arena;
  keel::Block genesis, a1, a2, b1;
};

/**
 * @given stored block
 * @when inserting it again
 * @then insertion is reported as duplicate
 */
TEST_F(BlockArenaTest, InsertIsIdempotent) {
  EXPECT_FALSE(arena.insert(a1));
  EXPECT_EQ(arena.size(), 4);
  EXPECT_EQ(arena.get(genesis.hash())->children.size(), 2);
}

/**
 * @given fork at genesis
 * @when querying ancestry
 * @then branch relations follow parent links
 */
TEST_F(BlockArenaTest, Ancestry) {
  EXPECT_EQ(arena.parentOf(a2.hash()), a1.hash());
  EXPECT_EQ(arena.parentOf(genesis.hash()), std::nullopt);
  EXPECT_EQ(arena.ancestorAt(a2.hash(), 0), genesis.hash());
  EXPECT_EQ(arena.ancestorAt(a2.hash(), 2), a2.hash());
  EXPECT_EQ(arena.ancestorAt(a1.hash(), 2), std::nullopt);

  EXPECT_TRUE(arena.isDescendant(genesis.hash(), a2.hash()));
  EXPECT_TRUE(arena.isDescendant(a2.hash(), a2.hash()));
  EXPECT_FALSE(arena.isDescendant(b1.hash(), a2.hash()));
  EXPECT_FALSE(arena.isDescendant(a2.hash(), a1.hash()));

  auto leaves = arena.leaves();
  std::ranges::sort(leaves);
  std::vector expected{a2.hash(), b1.hash()};
  std::ranges::sort(expected);
  EXPECT_EQ(leaves, expected);
}

/**
 * @given fork at genesis
 * @when pruning to a1
 * @then only a1 subtree survives
 */
TEST_F(BlockArenaTest, PruneKeepsSubtree) {
  EXPECT_EQ(arena.prune(a1.hash()), 2);
  EXPECT_TRUE(arena.contains(a1.hash()));
  EXPECT_TRUE(arena.contains(a2.hash()));
  EXPECT_FALSE(arena.contains(genesis.hash()));
  EXPECT_FALSE(arena.contains(b1.hash()));
}
