/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/checkpoint_system.hpp"

#include <algorithm>

#include <gtest/gtest.h>

#include "consensus/finality_gadget.hpp"
#include "qtils/test/outcome.hpp"
#include "testutil/chain_builder.hpp"

using keel::FinalizedBy;
using keel::VotePhase;
using keel::consensus::CheckpointSystem;
using keel::consensus::FinalityGadget;
using keel::consensus::Quorum;
using testutil::keypairOf;

class CheckpointSystemTest : public testing::Test {
 protected:
  void SetUp() override {
    genesis = testutil::makeGenesis(
        {{"alice", 10}, {"bob", 10}, {"carol", 10}, {"dave", 10}},
        keel::ConsensusConfig{.checkpoint_interval = 2});
    env = std::make_unique<testutil::RegistryEnv>(genesis);
    genesis_block = genesis.genesisBlock();
    auto quorum = Quorum::create(genesis.consensus.quorum).value();
    gadget = std::make_shared<FinalityGadget>(testutil::prepareLoggers(),
                                              env->registry,
                                              env->records,
                                              genesis.consensus,
                                              quorum,
                                              genesis_block);
    checkpoints = std::make_unique<CheckpointSystem>(testutil::prepareLoggers(),
                                                     env->registry,
                                                     gadget,
                                                     env->records,
                                                     genesis.consensus,
                                                     quorum);
    chain = testutil::makeChain(genesis_block, keypairOf("alice"), 4);
  }

  void addBlock(const keel::Block &block) {
    EXPECT_OUTCOME_SUCCESS(gadget->onBlock(block.header, block.hash()));
    EXPECT_OUTCOME_SUCCESS(checkpoints->onBlock(block.header, block.hash()));
  }

  std::optional<keel::Checkpoint> signByQuorum(const keel::Block &block) {
    std::optional<keel::Checkpoint> sealed;
    for (auto signer : {"alice", "bob", "carol"}) {
      auto res = checkpoints->onSignature(
          testutil::makeCheckpointSignature(keypairOf(signer), block));
      EXPECT_TRUE(res.has_value());
      if (res.has_value() and res.value()) {
        sealed = res.value();
      }
    }
    return sealed;
  }

  keel::GenesisConfig genesis;
  std::unique_ptr<testutil::RegistryEnv> env;
  keel::Block genesis_block;
  std::shared_ptr<FinalityGadget> gadget;
  std::unique_ptr<CheckpointSystem> checkpoints;
  std::vector<keel::Block> chain;
};

/**
 * @given checkpoint interval of 2
 * @when checking heights
 * @then multiples of interval above genesis are checkpoint heights
 */
TEST_F(CheckpointSystemTest, CheckpointHeights) {
  EXPECT_FALSE(checkpoints->isCheckpointHeight(0));
  EXPECT_FALSE(checkpoints->isCheckpointHeight(1));
  EXPECT_TRUE(checkpoints->isCheckpointHeight(2));
  EXPECT_TRUE(checkpoints->isCheckpointHeight(4));
}

/**
 * @given known block at checkpoint height
 * @when quorum of validators signs it
 * @then checkpoint is sealed, stored and finalizes block with ancestors
 */
TEST_F(CheckpointSystemTest, SealsAndFinalizes) {
  addBlock(chain[0]);
  addBlock(chain[1]);
  auto sealed = signByQuorum(chain[1]);
  ASSERT_TRUE(sealed.has_value());
  EXPECT_EQ(sealed->height, 2);
  EXPECT_EQ(sealed->block_hash, chain[1].hash());
  EXPECT_EQ(sealed->state_root, chain[1].header.state_root);
  EXPECT_EQ(sealed->signatures.size(), 3);

  EXPECT_EQ(checkpoints->latest(), sealed);
  EXPECT_EQ(checkpoints->at(2), sealed);
  EXPECT_EQ(gadget->latestFinalized().height, 2);
  EXPECT_EQ(gadget->finalizedAt(2)->finalized_by, FinalizedBy::Checkpoint);
  EXPECT_EQ(gadget->finalizedAt(1)->finalized_by, FinalizedBy::Descendant);
}

/**
 * @given signatures arriving before their block
 * @when block arrives
 * @then checkpoint is sealed on block arrival
 */
TEST_F(CheckpointSystemTest, SignaturesBeforeBlock) {
  addBlock(chain[0]);
  EXPECT_EQ(signByQuorum(chain[1]), std::nullopt);
  EXPECT_OUTCOME_SUCCESS(gadget->onBlock(chain[1].header, chain[1].hash()));
  ASSERT_OUTCOME_SUCCESS(sealed,
                         checkpoints->onBlock(chain[1].header, chain[1].hash()));
  ASSERT_TRUE(sealed.has_value());
  EXPECT_EQ(sealed->height, 2);
}

/**
 * @given sealed checkpoint at height 4
 * @when signatures for height 2 or non-checkpoint height arrive
 * @then they are rejected, latest checkpoint never goes back
 */
TEST_F(CheckpointSystemTest, HeightsStrictlyIncrease) {
  for (auto &block : chain) {
    addBlock(block);
  }
  ASSERT_TRUE(signByQuorum(chain[3]).has_value());

  ASSERT_OUTCOME_ERROR(checkpoints->onSignature(testutil::makeCheckpointSignature(
                           keypairOf("dave"), chain[1])),
                       CheckpointSystem::Error::BELOW_LATEST_CHECKPOINT);
  ASSERT_OUTCOME_ERROR(checkpoints->onSignature(testutil::makeCheckpointSignature(
                           keypairOf("dave"), chain[2])),
                       CheckpointSystem::Error::NOT_CHECKPOINT_HEIGHT);

  // Late signature for sealed checkpoint is fine
  ASSERT_OUTCOME_SUCCESS(late,
                         checkpoints->onSignature(testutil::makeCheckpointSignature(
                             keypairOf("dave"), chain[3])));
  EXPECT_EQ(late, std::nullopt);
  EXPECT_EQ(checkpoints->latest()->height, 4);
}

/**
 * @given block finalized at checkpoint height
 * @when signature for another block at that height arrives
 * @then it is rejected
 */
TEST_F(CheckpointSystemTest, ConflictWithFinalized) {
  addBlock(chain[0]);
  addBlock(chain[1]);
  for (auto voter : {"alice", "bob", "carol"}) {
    for (auto phase : {VotePhase::Prepare, VotePhase::Commit}) {
      EXPECT_OUTCOME_SUCCESS(gadget->onVote(
          testutil::makeVote(keypairOf(voter), chain[1], phase)));
    }
  }
  ASSERT_EQ(gadget->latestFinalized().height, 2);

  auto fork = testutil::makeChild(chain[0], keypairOf("bob"), 2, 0, "fork");
  ASSERT_OUTCOME_ERROR(checkpoints->onSignature(testutil::makeCheckpointSignature(
                           keypairOf("alice"), fork)),
                       CheckpointSystem::Error::CONFLICTS_WITH_FINALIZED);
}

/**
 * @given externally assembled checkpoint
 * @when sealing it
 * @then quorum and signatures are re-checked
 */
TEST_F(CheckpointSystemTest, SealExternalCheckpoint) {
  addBlock(chain[0]);
  addBlock(chain[1]);

  keel::Checkpoint checkpoint{
      .height = 2,
      .block_hash = chain[1].hash(),
      .state_root = chain[1].header.state_root,
  };
  for (auto signer : {"alice", "bob"}) {
    checkpoint.signatures.emplace_back(
        testutil::makeCheckpointSignature(keypairOf(signer), chain[1]));
  }
  ASSERT_OUTCOME_ERROR(checkpoints->seal(checkpoint),
                       CheckpointSystem::Error::INSUFFICIENT_QUORUM);

  auto forged = checkpoint;
  forged.signatures.emplace_back(
      testutil::makeCheckpointSignature(keypairOf("carol"), chain[1]));
  forged.signatures.back().signature[0] ^= 1;
  ASSERT_OUTCOME_ERROR(checkpoints->seal(forged),
                       CheckpointSystem::Error::INVALID_SIGNATURE);

  checkpoint.signatures.emplace_back(
      testutil::makeCheckpointSignature(keypairOf("carol"), chain[1]));
  EXPECT_OUTCOME_SUCCESS(checkpoints->seal(checkpoint));
  EXPECT_EQ(checkpoints->latest()->power, 30);
  EXPECT_EQ(gadget->latestFinalized().height, 2);

  // Same checkpoint delivered twice
  EXPECT_OUTCOME_SUCCESS(checkpoints->seal(checkpoint));
}

/**
 * @given sealed checkpoints at heights 2 and 4
 * @when checkpoint at height 2 is seen again, as signature or whole
 * @then it is a no-op
 */
TEST_F(CheckpointSystemTest, ResealingOlderCheckpointIsNoop) {
  for (auto &block : chain) {
    addBlock(block);
  }
  ASSERT_TRUE(signByQuorum(chain[1]).has_value());
  ASSERT_TRUE(signByQuorum(chain[3]).has_value());

  ASSERT_OUTCOME_SUCCESS(late,
                         checkpoints->onSignature(testutil::makeCheckpointSignature(
                             keypairOf("dave"), chain[1])));
  EXPECT_EQ(late, std::nullopt);

  auto sealed = checkpoints->at(2);
  ASSERT_TRUE(sealed.has_value());
  EXPECT_OUTCOME_SUCCESS(checkpoints->seal(*sealed));
  EXPECT_EQ(checkpoints->latest()->height, 4);
  EXPECT_EQ(checkpoints->at(2), sealed);
}

/**
 * @given nothing finalized beyond genesis
 * @when signatures for distant checkpoint heights arrive
 * @then only heights within lookahead are kept
 */
TEST_F(CheckpointSystemTest, SignaturesTooFarAhead) {
  auto lookahead = std::max(genesis.consensus.safety_window,
                            genesis.consensus.checkpoint_interval);
  auto far = testutil::makeChain(genesis_block, keypairOf("alice"), lookahead + 2);

  ASSERT_OUTCOME_SUCCESS(within,
                         checkpoints->onSignature(testutil::makeCheckpointSignature(
                             keypairOf("bob"), far[lookahead - 1])));
  EXPECT_EQ(within, std::nullopt);
  ASSERT_OUTCOME_ERROR(checkpoints->onSignature(testutil::makeCheckpointSignature(
                           keypairOf("bob"), far[lookahead + 1])),
                       CheckpointSystem::Error::TOO_FAR_AHEAD);
}

/**
 * @given alice signed checkpoint at height 2
 * @when alice signs another block at the same height
 * @then second signature is rejected, resending first one is a no-op
 */
TEST_F(CheckpointSystemTest, OneSignaturePerSignerAndHeight) {
  addBlock(chain[0]);
  addBlock(chain[1]);
  auto fork = testutil::makeChild(chain[0], keypairOf("bob"), 2, 0, "fork");

  ASSERT_OUTCOME_SUCCESS(first,
                         checkpoints->onSignature(testutil::makeCheckpointSignature(
                             keypairOf("alice"), chain[1])));
  EXPECT_EQ(first, std::nullopt);
  ASSERT_OUTCOME_ERROR(checkpoints->onSignature(testutil::makeCheckpointSignature(
                           keypairOf("alice"), fork)),
                       CheckpointSystem::Error::CONFLICTING_SIGNATURE);
  ASSERT_OUTCOME_SUCCESS(again,
                         checkpoints->onSignature(testutil::makeCheckpointSignature(
                             keypairOf("alice"), chain[1])));
  EXPECT_EQ(again, std::nullopt);

  // Remaining signers still seal the block alice signed
  for (auto signer : {"bob", "carol"}) {
    EXPECT_OUTCOME_SUCCESS(checkpoints->onSignature(
        testutil::makeCheckpointSignature(keypairOf(signer), chain[1])));
  }
  ASSERT_TRUE(checkpoints->latest().has_value());
  EXPECT_EQ(checkpoints->latest()->block_hash, chain[1].hash());
}

/**
 * @given height 2 finalized and a fork branching below it
 * @when quorum signs fork block at checkpoint height 4
 * @then checkpoint is neither recorded nor finalized, gadget keeps running
 */
TEST_F(CheckpointSystemTest, ForkCheckpointNotRecorded) {
  auto fork = testutil::makeChain(chain[0], keypairOf("bob"), 3, "fork");
  for (auto &block : chain) {
    addBlock(block);
  }
  for (auto &block : fork) {
    addBlock(block);
  }
  for (auto voter : {"alice", "bob", "carol"}) {
    for (auto phase : {VotePhase::Prepare, VotePhase::Commit}) {
      EXPECT_OUTCOME_SUCCESS(gadget->onVote(
          testutil::makeVote(keypairOf(voter), chain[1], phase)));
    }
  }
  ASSERT_EQ(gadget->latestFinalized().height, 2);
  ASSERT_EQ(fork[2].header.height, 4);

  for (auto signer : {"alice", "bob"}) {
    EXPECT_OUTCOME_SUCCESS(checkpoints->onSignature(
        testutil::makeCheckpointSignature(keypairOf(signer), fork[2])));
  }
  ASSERT_OUTCOME_ERROR(checkpoints->onSignature(testutil::makeCheckpointSignature(
                           keypairOf("carol"), fork[2])),
                       CheckpointSystem::Error::CONFLICTS_WITH_FINALIZED);

  EXPECT_EQ(checkpoints->latest(), std::nullopt);
  EXPECT_EQ(checkpoints->at(4), std::nullopt);
  EXPECT_FALSE(gadget->isHalted());
  EXPECT_EQ(gadget->latestFinalized().block_hash, chain[1].hash());
}
