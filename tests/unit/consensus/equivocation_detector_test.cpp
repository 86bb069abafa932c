/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/equivocation_detector.hpp"

#include <gtest/gtest.h>

#include "testutil/chain_builder.hpp"

using keel::Offense;
using keel::VotePhase;
using keel::consensus::EquivocationDetector;
using testutil::keypairOf;

class EquivocationDetectorTest : public testing::Test {
 protected:
  void SetUp() override {
    auto genesis_block = testutil::makeGenesis({{"alice", 10}}).genesisBlock();
    a = testutil::makeChain(genesis_block, keypairOf("alice"), 12, "a");
    b = testutil::makeChain(genesis_block, keypairOf("alice"), 12, "b");
  }

  keel::ConsensusConfig config{
      .slashing = {.recent_vote_window = 4},
  };
  EquivocationDetector detector{testutil::prepareLoggers(), config};
  keel::crypto::ed25519::KeyPair bob = keypairOf("bob");
  std::vector<keel::Block> a, b;
};

/**
 * @given prepare vote for a block
 * @when same validator votes for another block at same height and round
 * @then double-sign evidence carries both votes
 */
TEST_F(EquivocationDetectorTest, DoubleSign) {
  auto first = testutil::makeVote(bob, a[0], VotePhase::Prepare);
  auto second = testutil::makeVote(bob, b[0], VotePhase::Prepare);
  EXPECT_EQ(detector.observe(first, 0), std::nullopt);
  auto evidence = detector.observe(second, 0);
  ASSERT_TRUE(evidence.has_value());
  EXPECT_EQ(evidence->offense, Offense::DoubleSign);
  EXPECT_EQ(evidence->offender, testutil::idOf("bob"));
  EXPECT_EQ(evidence->height, 1);
  EXPECT_EQ(evidence->first, first);
  EXPECT_EQ(evidence->second, second);
}

/**
 * @given prepare vote for a block
 * @when validator commits same block or re-sends its vote
 * @then no evidence is produced
 */
TEST_F(EquivocationDetectorTest, SameBlockIsNotEquivocation) {
  EXPECT_EQ(
      detector.observe(testutil::makeVote(bob, a[0], VotePhase::Prepare), 0),
      std::nullopt);
  EXPECT_EQ(
      detector.observe(testutil::makeVote(bob, a[0], VotePhase::Commit), 0),
      std::nullopt);
  EXPECT_EQ(
      detector.observe(testutil::makeVote(bob, a[0], VotePhase::Prepare), 0),
      std::nullopt);
}

/**
 * @given votes for different blocks in different rounds
 * @when observed
 * @then no evidence is produced
 */
TEST_F(EquivocationDetectorTest, DifferentRoundsAreLegal) {
  auto other_round =
      testutil::makeChild(a[0], keypairOf("alice"), a[0].header.slot + 1, 1);
  auto other_round_fork = testutil::makeChild(
      a[0], keypairOf("alice"), a[0].header.slot + 1, 0, "fork");
  EXPECT_EQ(detector.observe(
                testutil::makeVote(bob, other_round, VotePhase::Prepare), 1),
            std::nullopt);
  EXPECT_EQ(
      detector.observe(
          testutil::makeVote(bob, other_round_fork, VotePhase::Prepare), 1),
      std::nullopt);
}

/**
 * @given detection window of 4 heights
 * @when local chain advances to height 10
 * @then old votes are forgotten and conflicts below window go unnoticed
 */
TEST_F(EquivocationDetectorTest, WindowBoundsMemory) {
  for (size_t i = 0; i < 10; ++i) {
    EXPECT_EQ(
        detector.observe(testutil::makeVote(bob, a[i], VotePhase::Prepare),
                         a[i].header.height),
        std::nullopt);
  }
  EXPECT_EQ(detector.trackedVotes(), 5);
  EXPECT_EQ(
      detector.observe(testutil::makeVote(bob, b[2], VotePhase::Prepare), 10),
      std::nullopt);
  EXPECT_TRUE(
      detector.observe(testutil::makeVote(bob, b[7], VotePhase::Prepare), 10));
}

/**
 * @given bob signs a vote at a far future height
 * @when bob then double-signs at the current height
 * @then far vote is not tracked and double-sign is still detected
 */
TEST_F(EquivocationDetectorTest, FarFutureVoteDoesNotMoveWindow) {
  auto far = keel::consensus::signVote(
      bob,
      keel::Vote::make(testutil::idOf("bob"),
                       a[11].hash(),
                       1'000'000'000,
                       0,
                       VotePhase::Prepare));
  ASSERT_TRUE(far.has_value());
  EXPECT_EQ(detector.observe(far.value(), 1), std::nullopt);
  EXPECT_EQ(detector.trackedVotes(), 0);

  EXPECT_EQ(
      detector.observe(testutil::makeVote(bob, a[0], VotePhase::Prepare), 1),
      std::nullopt);
  auto evidence =
      detector.observe(testutil::makeVote(bob, b[0], VotePhase::Prepare), 1);
  ASSERT_TRUE(evidence.has_value());
  EXPECT_EQ(evidence->offense, Offense::DoubleSign);
  EXPECT_EQ(evidence->height, 1);
}

/**
 * @given finality certificate at height 1 signed by bob
 * @when bob commits a conflicting block at that height
 * @then long-range evidence pairs certified and new vote
 */
TEST_F(EquivocationDetectorTest, LongRange) {
  auto certified = testutil::makeVote(bob, a[0], VotePhase::Commit);
  keel::QuorumCertificate qc{
      .block_hash = a[0].hash(),
      .height = 1,
      .votes = {certified},
  };

  // Prepare for another block before locking is legal
  EXPECT_EQ(detector.observeAgainstFinalized(
                testutil::makeVote(bob, b[0], VotePhase::Prepare), qc),
            std::nullopt);
  // Validator outside of certificate is not accountable
  EXPECT_EQ(
      detector.observeAgainstFinalized(
          testutil::makeVote(keypairOf("carol"), b[0], VotePhase::Commit), qc),
      std::nullopt);

  auto conflicting = testutil::makeVote(bob, b[0], VotePhase::Commit);
  auto evidence = detector.observeAgainstFinalized(conflicting, qc);
  ASSERT_TRUE(evidence.has_value());
  EXPECT_EQ(evidence->offense, Offense::LongRangeEquivocation);
  EXPECT_EQ(evidence->first, certified);
  EXPECT_EQ(evidence->second, conflicting);
}

/**
 * @given consecutive misses of validator
 * @when unavailability evidence is built
 * @then it carries epoch and miss count without votes
 */
TEST_F(EquivocationDetectorTest, Unavailability) {
  auto evidence = detector.unavailability(testutil::idOf("bob"), 3, 100, 9);
  EXPECT_EQ(evidence.offense, Offense::Unavailability);
  EXPECT_EQ(evidence.epoch, 3);
  EXPECT_EQ(evidence.consecutive_missed, 9);
  EXPECT_FALSE(evidence.isSigned());
  EXPECT_FALSE(evidence.first.has_value());
}
