/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/validator_registry_impl.hpp"

#include <gtest/gtest.h>

#include "mock/blockchain/stake_treasury_mock.hpp"
#include "qtils/test/outcome.hpp"
#include "testutil/chain_builder.hpp"

using keel::SlashSeverity;
using keel::ValidatorRegistry;
using keel::ValidatorStatus;
using testutil::idOf;

class ValidatorRegistryTest : public testing::Test {
 protected:
  static keel::ConsensusConfig config() {
    return keel::ConsensusConfig{
        .max_validators = 3,
        .min_stake = 10,
        .stake_per_power_unit = 10,
    };
  }

  testutil::RegistryEnv env{testutil::makeGenesis(
      {{"alice", 100}, {"bob", 300}, {"carol", 200}, {"dave", 50}, {"eve", 5}},
      config())};
};

/**
 * @given five stakeholders and room for three validators
 * @when epoch 0 set is built
 * @then three largest stakes are active in descending stake order, rest queued
 */
TEST_F(ValidatorRegistryTest, SelectsLargestStakes) {
  auto snapshot = env.registry->current();
  ASSERT_EQ(snapshot->active_count, 3);
  EXPECT_EQ(snapshot->validators[0].id, idOf("bob"));
  EXPECT_EQ(snapshot->validators[1].id, idOf("carol"));
  EXPECT_EQ(snapshot->validators[2].id, idOf("alice"));
  EXPECT_EQ(snapshot->total_power, 60);

  EXPECT_EQ(env.registry->votingPower(idOf("bob")), 30);
  EXPECT_EQ(env.registry->votingPower(idOf("dave")), 0);
  EXPECT_TRUE(env.registry->isEligible(idOf("alice")));
  EXPECT_FALSE(env.registry->isEligible(idOf("dave")));

  // Below minimal stake never becomes a candidate
  EXPECT_FALSE(snapshot->find(idOf("eve")));
  auto eve = env.registry->validator(idOf("eve"));
  ASSERT_TRUE(eve.has_value());
  EXPECT_EQ(eve->status, ValidatorStatus::Queued);
  EXPECT_EQ(env.registry->validator(idOf("dave"))->status,
            ValidatorStatus::Queued);
}

/**
 * @given registry at epoch 0
 * @when rotating to epoch 0 again
 * @then rotation is rejected
 */
TEST_F(ValidatorRegistryTest, RotationMustAdvance) {
  ASSERT_OUTCOME_ERROR(env.registry->rotate(0, keel::kZeroHash),
                       ValidatorRegistry::Error::EPOCH_NOT_ADVANCING);
}

/**
 * @given stake of queued validator grows above active one
 * @when rotating to next epoch
 * @then delta reports swap and handlers see new snapshot
 */
TEST_F(ValidatorRegistryTest, RotationReportsDelta) {
  std::optional<keel::Epoch> notified;
  env.registry->onSetChange(
      [&](const keel::ValidatorSetSnapshot &snapshot, const keel::SetDelta &) {
        notified = snapshot.epoch;
      });

  env.treasury->deposit(idOf("dave"), 100);
  env.treasury->deposit(idOf("bob"), 10);

  ASSERT_OUTCOME_SUCCESS(delta, env.registry->rotate(1, keel::kZeroHash));
  EXPECT_EQ(delta.epoch, 1);
  EXPECT_EQ(delta.added, std::vector{idOf("dave")});
  EXPECT_EQ(delta.removed, std::vector{idOf("alice")});
  EXPECT_EQ(delta.power_changed, std::vector{idOf("bob")});
  EXPECT_EQ(notified, 1);

  // Old snapshot stays frozen
  EXPECT_TRUE(env.registry->snapshotFor(0)->isActive(idOf("alice")));
  EXPECT_FALSE(env.registry->snapshotFor(1)->isActive(idOf("alice")));
  EXPECT_TRUE(env.records->snapshotAt(1).has_value());
}

/**
 * @given same stakes and randomness
 * @when two registries rotate
 * @then seeds are equal, and differ for other randomness
 */
TEST_F(ValidatorRegistryTest, SeedIsDeterministic) {
  testutil::RegistryEnv other{testutil::makeGenesis(
      {{"alice", 100}, {"bob", 300}, {"carol", 200}, {"dave", 50}, {"eve", 5}},
      config())};
  EXPECT_EQ(env.registry->current()->seed, other.registry->current()->seed);

  auto randomness = keel::crypto::sha256("finalized");
  EXPECT_OUTCOME_SUCCESS(env.registry->rotate(1, randomness));
  EXPECT_OUTCOME_SUCCESS(other.registry->rotate(1, keel::kZeroHash));
  EXPECT_NE(env.registry->current()->seed, other.registry->current()->seed);
}

/**
 * @given active validator
 * @when slashed with minor severity keeping stake above minimum
 * @then stake drops, treasury is debited, status is unchanged
 */
TEST_F(ValidatorRegistryTest, MinorSlashKeepsValidator) {
  ASSERT_OUTCOME_SUCCESS(
      stake, env.registry->applySlash(idOf("bob"), 30, SlashSeverity::Minor));
  EXPECT_EQ(stake, 270);
  EXPECT_EQ(env.treasury->currentStake(idOf("bob")), 270);
  EXPECT_EQ(env.treasury->burned(), 30);
  EXPECT_TRUE(env.registry->isEligible(idOf("bob")));
}

/**
 * @given active validator
 * @when slashed with severe severity or below minimal stake
 * @then validator is ejected and stays ejected across rotation
 */
TEST_F(ValidatorRegistryTest, EjectedValidatorNeverReturns) {
  EXPECT_OUTCOME_SUCCESS(
      env.registry->applySlash(idOf("bob"), 1, SlashSeverity::Severe));
  ASSERT_OUTCOME_SUCCESS(
      stake,
      env.registry->applySlash(idOf("alice"), 1000, SlashSeverity::Minor));
  EXPECT_EQ(stake, 0);

  EXPECT_FALSE(env.registry->isEligible(idOf("bob")));
  EXPECT_FALSE(env.registry->isEligible(idOf("alice")));
  // Power stays frozen until rotation
  EXPECT_EQ(env.registry->totalPower(), 60);

  env.treasury->deposit(idOf("alice"), 1000);
  EXPECT_OUTCOME_SUCCESS(env.registry->rotate(1, keel::kZeroHash));
  auto snapshot = env.registry->current();
  EXPECT_FALSE(snapshot->isActive(idOf("bob")));
  EXPECT_FALSE(snapshot->isActive(idOf("alice")));
  EXPECT_EQ(env.registry->validator(idOf("bob"))->status,
            ValidatorStatus::Ejected);
}

/**
 * @given unknown validator
 * @when slashing it
 * @then error is returned
 */
TEST_F(ValidatorRegistryTest, SlashUnknownValidator) {
  ASSERT_OUTCOME_ERROR(
      env.registry->applySlash(idOf("mallory"), 1, SlashSeverity::Minor),
      ValidatorRegistry::Error::UNKNOWN_VALIDATOR);
}

/**
 * @given validator missing votes
 * @when it votes again
 * @then consecutive misses reset while totals keep counting
 */
TEST_F(ValidatorRegistryTest, ParticipationCounters) {
  env.registry->recordParticipation(idOf("carol"), false);
  env.registry->recordParticipation(idOf("carol"), false);
  EXPECT_EQ(env.registry->validator(idOf("carol"))->consecutive_missed, 2);
  env.registry->recordParticipation(idOf("carol"), true);
  auto carol = env.registry->validator(idOf("carol"));
  EXPECT_EQ(carol->votes_cast, 1);
  EXPECT_EQ(carol->votes_missed, 2);
  EXPECT_EQ(carol->consecutive_missed, 0);
}

/**
 * @given treasury mock
 * @when validator is slashed
 * @then exactly deducted amount is reported as penalty
 */
TEST(ValidatorRegistryTreasuryTest, PenaltyGoesToTreasury) {
  auto treasury = std::make_shared<keel::StakeTreasuryMock>();
  auto alice = idOf("alice");
  EXPECT_CALL(*treasury, stakeholders())
      .WillRepeatedly(testing::Return(std::vector{alice}));
  EXPECT_CALL(*treasury, currentStake(alice))
      .WillRepeatedly(testing::Return(40));
  EXPECT_CALL(*treasury, applyPenalty(alice, 40)).Times(1);

  keel::ValidatorRegistryImpl registry{
      testutil::prepareLoggers(),
      treasury,
      std::make_shared<keel::InMemoryConsensusRecords>(),
      keel::ConsensusConfig{},
  };
  ASSERT_OUTCOME_SUCCESS(
      stake, registry.applySlash(alice, 100, SlashSeverity::Minor));
  EXPECT_EQ(stake, 0);
}
