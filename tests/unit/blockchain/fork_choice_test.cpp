/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/fork_choice.hpp"

#include <gtest/gtest.h>

#include "qtils/test/outcome.hpp"
#include "testutil/chain_builder.hpp"

using keel::ForkChoice;
using keel::VotePhase;
using testutil::keypairOf;

class ForkChoiceTest : public testing::Test {
 protected:
  void SetUp() override {
    genesis = testutil::makeGenesis(
        {{"alice", 10}, {"bob", 20}, {"carol", 30}, {"dave", 40}}, config);
    env = std::make_unique<testutil::RegistryEnv>(genesis);
    genesis_block = genesis.genesisBlock();
    fork_choice = std::make_unique<ForkChoice>(testutil::prepareLoggers(),
                                               env->registry,
                                               genesis.consensus,
                                               genesis_block);
  }

  void vote(std::string_view voter, const keel::Block &block) {
    fork_choice->onVote(
        testutil::makeVote(keypairOf(voter), block, VotePhase::Prepare).data);
  }

  keel::ConsensusConfig config{
      .orphan_buffer_limit = 4,
      .orphan_timeout_slots = 2,
  };
  keel::GenesisConfig genesis;
  std::unique_ptr<testutil::RegistryEnv> env;
  keel::Block genesis_block;
  std::unique_ptr<ForkChoice> fork_choice;
  keel::crypto::ed25519::KeyPair alice = keypairOf("alice");
};

/**
 * @given genesis only
 * @when importing a linear chain
 * @then head follows the tip
 */
TEST_F(ForkChoiceTest, LinearChainHead) {
  EXPECT_EQ(fork_choice->head(), genesis_block.hash());
  auto chain = testutil::makeChain(genesis_block, alice, 3);
  for (auto &block : chain) {
    ASSERT_OUTCOME_SUCCESS(insertion, fork_choice->onBlock(block));
    EXPECT_EQ(insertion.integrated, std::vector{block.hash()});
    EXPECT_EQ(insertion.head, block.hash());
  }
  EXPECT_EQ(fork_choice->headHeader().height, 3);
  EXPECT_EQ(fork_choice->canonicalChain().size(), 3);
  EXPECT_TRUE(fork_choice->isCanonical(chain[1].hash()));
}

/**
 * @given child arriving before its parent
 * @when parent arrives
 * @then child is buffered first and integrated right after parent
 */
TEST_F(ForkChoiceTest, OrphanIntegratedWithParent) {
  auto chain = testutil::makeChain(genesis_block, alice, 3);
  ASSERT_OUTCOME_SUCCESS(buffered, fork_choice->onBlock(chain[2]));
  EXPECT_TRUE(buffered.buffered);
  ASSERT_OUTCOME_SUCCESS(buffered_again, fork_choice->onBlock(chain[1]));
  EXPECT_TRUE(buffered_again.buffered);
  EXPECT_EQ(fork_choice->orphanCount(), 2);

  ASSERT_OUTCOME_SUCCESS(insertion, fork_choice->onBlock(chain[0]));
  EXPECT_EQ(insertion.integrated,
            (std::vector{chain[0].hash(), chain[1].hash(), chain[2].hash()}));
  EXPECT_EQ(insertion.head, chain[2].hash());
  EXPECT_EQ(fork_choice->orphanCount(), 0);
}

/**
 * @given buffered orphan
 * @when slots pass beyond orphan timeout
 * @then orphan is dropped
 */
TEST_F(ForkChoiceTest, OrphansExpire) {
  auto chain = testutil::makeChain(genesis_block, alice, 2);
  EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(chain[1]));
  EXPECT_EQ(fork_choice->expireOrphans(4), 0);
  EXPECT_EQ(fork_choice->expireOrphans(5), 1);
  EXPECT_EQ(fork_choice->orphanCount(), 0);
}

/**
 * @given full orphan buffer
 * @when one more orphan arrives
 * @then oldest one is evicted
 */
TEST_F(ForkChoiceTest, OrphanBufferBounded) {
  auto chain = testutil::makeChain(genesis_block, alice, 6);
  for (size_t i = 1; i < chain.size(); ++i) {
    EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(chain[i]));
  }
  EXPECT_EQ(fork_choice->orphanCount(), 4);
  ASSERT_OUTCOME_SUCCESS(insertion, fork_choice->onBlock(chain[0]));
  // chain[1] was evicted, so nothing above chain[0] connects
  EXPECT_EQ(insertion.integrated, std::vector{chain[0].hash()});
}

/**
 * @given blocks breaking chain rules
 * @when importing them
 * @then each is rejected with its reason
 */
TEST_F(ForkChoiceTest, RejectsInvalidBlocks) {
  auto block = testutil::makeChild(genesis_block, alice, 1);

  auto bad_root = block;
  bad_root.header.state_root = keel::crypto::sha256("bogus");
  ASSERT_OUTCOME_ERROR(fork_choice->onBlock(bad_root),
                       ForkChoice::Error::STATE_ROOT_MISMATCH);

  EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(block));
  auto child = testutil::makeChild(block, alice, 2);
  child.header.height = 3;
  ASSERT_OUTCOME_ERROR(fork_choice->onBlock(child),
                       ForkChoice::Error::INVALID_HEIGHT);

  auto same_slot = testutil::makeChild(block, alice, 1);
  ASSERT_OUTCOME_ERROR(fork_choice->onBlock(same_slot),
                       ForkChoice::Error::INVALID_SLOT);

  EXPECT_EQ(fork_choice->head(), block.hash());
}

/**
 * @given fork where shorter branch carries more votes
 * @when selecting head with GHOST
 * @then heavier branch wins over longer one
 */
TEST_F(ForkChoiceTest, GhostFollowsVotes) {
  auto a = testutil::makeChain(genesis_block, alice, 3, "a");
  auto b = testutil::makeChain(genesis_block, alice, 1, "b");
  for (auto &block : a) {
    EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(block));
  }
  EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(b[0]));

  vote("alice", a[2]);
  vote("dave", b[0]);
  EXPECT_EQ(fork_choice->head(), b[0].hash());

  vote("bob", a[1]);
  vote("carol", a[0]);
  EXPECT_EQ(fork_choice->head(), a[2].hash());
}

/**
 * @given validator with a newer vote
 * @when an older vote of it arrives
 * @then older vote is ignored
 */
TEST_F(ForkChoiceTest, KeepsLatestVote) {
  auto a = testutil::makeChain(genesis_block, alice, 2, "a");
  auto b = testutil::makeChain(genesis_block, alice, 1, "b");
  for (auto &block : a) {
    EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(block));
  }
  EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(b[0]));

  vote("dave", a[1]);
  EXPECT_EQ(fork_choice->head(), a[1].hash());
  vote("dave", b[0]);
  EXPECT_EQ(fork_choice->head(), a[1].hash());
}

/**
 * @given fork below finalized block
 * @when block is finalized
 * @then other branch is pruned and blocks building on it are rejected
 */
TEST_F(ForkChoiceTest, FinalizationPrunes) {
  auto a = testutil::makeChain(genesis_block, alice, 2, "a");
  auto b = testutil::makeChain(genesis_block, alice, 2, "b");
  for (auto &block : a) {
    EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(block));
  }
  EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(b[0]));

  ASSERT_OUTCOME_SUCCESS(head, fork_choice->onFinalized(a[0].hash()));
  EXPECT_EQ(head, a[1].hash());
  EXPECT_EQ(fork_choice->root(), a[0].hash());
  EXPECT_FALSE(fork_choice->contains(b[0].hash()));
  EXPECT_FALSE(fork_choice->contains(genesis_block.hash()));

  ASSERT_OUTCOME_ERROR(fork_choice->onBlock(b[1]),
                       ForkChoice::Error::INVALID_ANCESTRY);
  ASSERT_OUTCOME_ERROR(fork_choice->onBlock(b[0]),
                       ForkChoice::Error::INVALID_ANCESTRY);
}

/**
 * @given longest chain strategy
 * @when votes favour shorter branch
 * @then highest block is still the head
 */
TEST(ForkChoiceLongestChainTest, HighestLeafWins) {
  auto genesis = testutil::makeGenesis(
      {{"alice", 10}, {"bob", 90}},
      keel::ConsensusConfig{.fork_choice = keel::LongestChainRule{}});
  testutil::RegistryEnv env{genesis};
  auto genesis_block = genesis.genesisBlock();
  ForkChoice fork_choice{
      testutil::prepareLoggers(), env.registry, genesis.consensus, genesis_block};

  auto alice = keypairOf("alice");
  auto a = testutil::makeChain(genesis_block, alice, 3, "a");
  auto b = testutil::makeChain(genesis_block, alice, 1, "b");
  for (auto &block : a) {
    EXPECT_OUTCOME_SUCCESS(fork_choice.onBlock(block));
  }
  EXPECT_OUTCOME_SUCCESS(fork_choice.onBlock(b[0]));
  fork_choice.onVote(
      testutil::makeVote(keypairOf("bob"), b[0], VotePhase::Commit).data);
  EXPECT_EQ(fork_choice.head(), a[2].hash());
}

/**
 * @given sealed checkpoint above root
 * @when fork choice learns about it
 * @then root moves to checkpoint
 */
TEST_F(ForkChoiceTest, CheckpointMovesRoot) {
  auto a = testutil::makeChain(genesis_block, alice, 3);
  for (auto &block : a) {
    EXPECT_OUTCOME_SUCCESS(fork_choice->onBlock(block));
  }
  EXPECT_OUTCOME_SUCCESS(fork_choice->onCheckpoint(a[1].hash()));
  EXPECT_EQ(fork_choice->root(), a[1].hash());
  EXPECT_EQ(fork_choice->head(), a[2].hash());
  ASSERT_OUTCOME_ERROR(fork_choice->onCheckpoint(keel::crypto::sha256("x")),
                       ForkChoice::Error::UNKNOWN_BLOCK);
}
