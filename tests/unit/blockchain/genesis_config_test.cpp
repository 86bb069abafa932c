/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/genesis_config.hpp"

#include <gtest/gtest.h>

#include "consensus/quorum.hpp"
#include "qtils/test/outcome.hpp"

using keel::GenesisConfigError;

/**
 * @given genesis yaml with validators and consensus section
 * @when parsing it
 * @then every parameter is read, omitted ones keep defaults
 */
TEST(GenesisConfigTest, ParsesFullConfig) {
  auto yaml = YAML::Load(R"(
genesis_time: 1700000000000
validators:
  - seed: alice
    stake: 100
  - pubkey: "0x0102030405060708091011121314151617181920212223242526272829303132"
    stake: 50
consensus:
  slots_per_epoch: 16
  max_validators: 7
  quorum: "3/4"
  leader_policy: stake_weighted
  fork_choice: longest_chain
  finality: confirmation_depth
  confirmation_depth: 6
  checkpoint_interval: 5
  slashing:
    double_sign_penalty_bps: 1000
  rewards:
    block_reward: 50
    proposer_share: 10
)");
  ASSERT_OUTCOME_SUCCESS(genesis, keel::parseGenesisYaml(yaml));
  EXPECT_EQ(genesis.genesis_time, 1700000000000);
  ASSERT_EQ(genesis.validators.size(), 2);
  EXPECT_TRUE(genesis.validators[0].seed.has_value());
  EXPECT_EQ(genesis.validators[0].id,
            keel::crypto::ed25519::publicKey(keel::crypto::ed25519::keypairFromSeed(
                keel::seedFromString("alice"))));
  EXPECT_FALSE(genesis.validators[1].seed.has_value());
  EXPECT_EQ(genesis.validators[1].id[0], 0x01);
  EXPECT_EQ(genesis.validators[1].stake, 50);

  auto &consensus = genesis.consensus;
  EXPECT_EQ(consensus.slots_per_epoch, 16);
  EXPECT_EQ(consensus.max_validators, 7);
  EXPECT_EQ(consensus.quorum.numerator, 3);
  EXPECT_EQ(consensus.quorum.denominator, 4);
  EXPECT_EQ(consensus.leader_policy, keel::LeaderPolicy::StakeWeighted);
  EXPECT_TRUE(std::holds_alternative<keel::LongestChainRule>(
      consensus.fork_choice));
  auto depth = std::get_if<keel::ConfirmationDepthFinality>(&consensus.finality);
  ASSERT_NE(depth, nullptr);
  EXPECT_EQ(depth->depth, 6);
  EXPECT_EQ(consensus.checkpoint_interval, 5);
  EXPECT_EQ(consensus.slashing.double_sign_penalty_bps, 1000);
  EXPECT_EQ(consensus.slashing.unavailability_cap_bps, 1000);
  EXPECT_EQ(consensus.rewards.block_reward, 50);
  EXPECT_EQ(consensus.rewards.proposer_share, 10);
  EXPECT_EQ(consensus.slot_duration_ms, 4000);
}

/**
 * @given two configs with same validators listed in different order
 * @when building genesis blocks
 * @then blocks are identical
 */
TEST(GenesisConfigTest, GenesisBlockIndependentOfListOrder) {
  auto a = keel::parseGenesisYaml(YAML::Load(R"(
validators:
  - { seed: alice, stake: 10 }
  - { seed: bob, stake: 20 }
)"));
  auto b = keel::parseGenesisYaml(YAML::Load(R"(
validators:
  - { seed: bob, stake: 20 }
  - { seed: alice, stake: 10 }
)"));
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  auto block = a.value().genesisBlock();
  EXPECT_EQ(block, b.value().genesisBlock());
  EXPECT_EQ(block.header.height, 0);
  EXPECT_EQ(block.header.parent_hash, keel::kZeroHash);
}

/**
 * @given invalid genesis documents
 * @when parsing them
 * @then matching error is reported
 */
TEST(GenesisConfigTest, RejectsInvalid) {
  ASSERT_OUTCOME_ERROR(keel::parseGenesisYaml(YAML::Load("validators: []")),
                       GenesisConfigError::NO_VALIDATORS);
  ASSERT_OUTCOME_ERROR(keel::parseGenesisYaml(YAML::Load(R"(
validators:
  - { seed: alice, stake: 10 }
  - { seed: alice, stake: 20 }
)")),
                       GenesisConfigError::DUPLICATE_VALIDATOR);
  ASSERT_OUTCOME_ERROR(keel::parseGenesisYaml(YAML::Load(R"(
validators:
  - { seed: alice, stake: 0 }
)")),
                       GenesisConfigError::INVALID_STAKE);
  ASSERT_OUTCOME_ERROR(keel::parseGenesisYaml(YAML::Load(R"(
validators:
  - { stake: 10 }
)")),
                       GenesisConfigError::INVALID_VALIDATOR);
  ASSERT_OUTCOME_ERROR(keel::parseGenesisYaml(YAML::Load(R"(
validators:
  - { seed: alice, stake: 10 }
consensus:
  leader_policy: lottery
)")),
                       GenesisConfigError::INVALID_CONSENSUS_PARAMETER);
  ASSERT_OUTCOME_ERROR(keel::parseGenesisYaml(YAML::Load(R"(
validators:
  - { seed: alice, stake: 10 }
consensus:
  slots_per_epoch: 0
)")),
                       GenesisConfigError::INVALID_CONSENSUS_PARAMETER);
  ASSERT_OUTCOME_ERROR(keel::parseGenesisYaml(YAML::Load(R"(
validators:
  - { seed: alice, stake: 10 }
consensus:
  quorum: "1/2"
)")),
                       keel::consensus::Quorum::Error::THRESHOLD_BELOW_FAULT_BOUND);
}

/**
 * @given hex seed and free-form seed
 * @when converting them to seeds
 * @then hex is decoded, other strings are hashed
 */
TEST(GenesisConfigTest, SeedFromString) {
  auto hex = keel::seedFromString(
      "0x0000000000000000000000000000000000000000000000000000000000000001");
  EXPECT_EQ(hex[31], 1);
  EXPECT_EQ(keel::seedFromString("alice"), keel::crypto::sha256("alice"));
}
