/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/genesis_config.hpp"

#include <set>

#include <qtils/unhex.hpp>

#include "consensus/quorum.hpp"
#include "crypto/sha/sha256.hpp"
#include "utils/le_bytes.hpp"

namespace keel {
  namespace {
    template <typename T>
    outcome::result<void> readScalar(const YAML::Node &section,
                                     const char *name,
                                     T &value) {
      auto node = section[name];
      if (not node.IsDefined()) {
        return outcome::success();
      }
      if (not node.IsScalar()) {
        return GenesisConfigError::INVALID_CONSENSUS_PARAMETER;
      }
      try {
        value = node.as<T>();
      } catch (const YAML::Exception &) {
        return GenesisConfigError::INVALID_CONSENSUS_PARAMETER;
      }
      return outcome::success();
    }

    outcome::result<QuorumThreshold> parseQuorum(const std::string &value) {
      QuorumThreshold threshold;
      auto slash = value.find('/');
      if (slash == std::string::npos) {
        return GenesisConfigError::INVALID_CONSENSUS_PARAMETER;
      }
      try {
        threshold.numerator = std::stoull(value.substr(0, slash));
        threshold.denominator = std::stoull(value.substr(slash + 1));
      } catch (const std::exception &) {
        return GenesisConfigError::INVALID_CONSENSUS_PARAMETER;
      }
      BOOST_OUTCOME_TRY(consensus::Quorum::create(threshold));
      return threshold;
    }

    outcome::result<void> parseConsensus(const YAML::Node &section,
                                         ConsensusConfig &config) {
      if (not section.IsMap()) {
        return GenesisConfigError::INVALID;
      }
      BOOST_OUTCOME_TRY(
          readScalar(section, "slots_per_epoch", config.slots_per_epoch));
      BOOST_OUTCOME_TRY(
          readScalar(section, "slot_duration_ms", config.slot_duration_ms));
      BOOST_OUTCOME_TRY(
          readScalar(section, "max_validators", config.max_validators));
      BOOST_OUTCOME_TRY(readScalar(section, "min_stake", config.min_stake));
      BOOST_OUTCOME_TRY(readScalar(
          section, "stake_per_power_unit", config.stake_per_power_unit));
      BOOST_OUTCOME_TRY(
          readScalar(section, "backup_count", config.backup_count));
      BOOST_OUTCOME_TRY(
          readScalar(section, "leader_timeout_ms", config.leader_timeout_ms));
      BOOST_OUTCOME_TRY(
          readScalar(section, "safety_window", config.safety_window));
      BOOST_OUTCOME_TRY(readScalar(
          section, "orphan_buffer_limit", config.orphan_buffer_limit));
      BOOST_OUTCOME_TRY(readScalar(
          section, "orphan_timeout_slots", config.orphan_timeout_slots));
      BOOST_OUTCOME_TRY(
          readScalar(section, "vote_buffer_limit", config.vote_buffer_limit));
      BOOST_OUTCOME_TRY(readScalar(section,
                                   "vote_buffer_expiry_heights",
                                   config.vote_buffer_expiry_heights));
      BOOST_OUTCOME_TRY(readScalar(
          section, "checkpoint_interval", config.checkpoint_interval));

      std::string value;
      if (section["quorum"].IsDefined()) {
        BOOST_OUTCOME_TRY(readScalar(section, "quorum", value));
        BOOST_OUTCOME_TRY(config.quorum, parseQuorum(value));
      }
      if (section["leader_policy"].IsDefined()) {
        BOOST_OUTCOME_TRY(readScalar(section, "leader_policy", value));
        if (value == "round_robin") {
          config.leader_policy = LeaderPolicy::RoundRobin;
        } else if (value == "stake_weighted") {
          config.leader_policy = LeaderPolicy::StakeWeighted;
        } else {
          return GenesisConfigError::INVALID_CONSENSUS_PARAMETER;
        }
      }
      if (section["fork_choice"].IsDefined()) {
        BOOST_OUTCOME_TRY(readScalar(section, "fork_choice", value));
        if (value == "ghost") {
          config.fork_choice = GhostRule{};
        } else if (value == "longest_chain") {
          config.fork_choice = LongestChainRule{};
        } else {
          return GenesisConfigError::INVALID_CONSENSUS_PARAMETER;
        }
      }
      if (section["finality"].IsDefined()) {
        BOOST_OUTCOME_TRY(readScalar(section, "finality", value));
        if (value == "bft") {
          config.finality = BftFinality{};
        } else if (value == "confirmation_depth") {
          ConfirmationDepthFinality depth;
          BOOST_OUTCOME_TRY(
              readScalar(section, "confirmation_depth", depth.depth));
          config.finality = depth;
        } else {
          return GenesisConfigError::INVALID_CONSENSUS_PARAMETER;
        }
      }

      if (auto slashing = section["slashing"]; slashing.IsDefined()) {
        if (not slashing.IsMap()) {
          return GenesisConfigError::INVALID;
        }
        auto &params = config.slashing;
        BOOST_OUTCOME_TRY(readScalar(
            slashing, "double_sign_penalty_bps", params.double_sign_penalty_bps));
        BOOST_OUTCOME_TRY(readScalar(slashing,
                                     "unavailability_per_miss_bps",
                                     params.unavailability_per_miss_bps));
        BOOST_OUTCOME_TRY(readScalar(
            slashing, "unavailability_cap_bps", params.unavailability_cap_bps));
        BOOST_OUTCOME_TRY(readScalar(slashing,
                                     "unavailability_threshold",
                                     params.unavailability_threshold));
        BOOST_OUTCOME_TRY(readScalar(slashing,
                                     "evidence_expiry_heights",
                                     params.evidence_expiry_heights));
        BOOST_OUTCOME_TRY(readScalar(
            slashing, "recent_vote_window", params.recent_vote_window));
      }

      if (auto rewards = section["rewards"]; rewards.IsDefined()) {
        if (not rewards.IsMap()) {
          return GenesisConfigError::INVALID;
        }
        auto &params = config.rewards;
        BOOST_OUTCOME_TRY(
            readScalar(rewards, "block_reward", params.block_reward));
        BOOST_OUTCOME_TRY(
            readScalar(rewards, "proposer_share", params.proposer_share));
        BOOST_OUTCOME_TRY(readScalar(
            rewards, "low_participation_bps", params.low_participation_bps));
        BOOST_OUTCOME_TRY(readScalar(
            rewards, "proposer_boost_bps", params.proposer_boost_bps));
        if (params.proposer_share > params.block_reward) {
          return GenesisConfigError::INVALID_CONSENSUS_PARAMETER;
        }
      }

      if (config.slots_per_epoch == 0 or config.max_validators == 0
          or config.stake_per_power_unit == 0
          or config.leader_timeout_ms == 0) {
        return GenesisConfigError::INVALID_CONSENSUS_PARAMETER;
      }
      return outcome::success();
    }

    outcome::result<GenesisValidator> parseValidator(const YAML::Node &node) {
      if (not node.IsMap()) {
        return GenesisConfigError::INVALID_VALIDATOR;
      }
      GenesisValidator validator;
      auto seed = node["seed"];
      auto pubkey = node["pubkey"];
      if (seed.IsDefined() and seed.IsScalar()) {
        validator.seed = seedFromString(seed.as<std::string>());
        validator.id = crypto::ed25519::publicKey(
            crypto::ed25519::keypairFromSeed(*validator.seed));
      } else if (pubkey.IsDefined() and pubkey.IsScalar()) {
        auto unhex_result =
            qtils::unhex0x(validator.id, pubkey.as<std::string>(), true);
        if (not unhex_result.has_value()) {
          return GenesisConfigError::INVALID_VALIDATOR;
        }
      } else {
        return GenesisConfigError::INVALID_VALIDATOR;
      }

      auto stake = node["stake"];
      if (not stake.IsDefined() or not stake.IsScalar()) {
        return GenesisConfigError::INVALID_STAKE;
      }
      try {
        validator.stake = stake.as<Amount>();
      } catch (const YAML::Exception &) {
        return GenesisConfigError::INVALID_STAKE;
      }
      if (validator.stake == 0) {
        return GenesisConfigError::INVALID_STAKE;
      }
      return validator;
    }
  }  // namespace

  crypto::ed25519::Seed seedFromString(std::string_view value) {
    crypto::ed25519::Seed seed;
    if (value.starts_with("0x")
        and value.size() == 2 + 2 * ED25519_SEED_LENGTH
        and qtils::unhex0x(seed, value, true).has_value()) {
      return seed;
    }
    auto hash = crypto::sha256(value);
    std::copy(hash.begin(), hash.end(), seed.begin());
    return seed;
  }

  outcome::result<GenesisConfig> parseGenesisYaml(const YAML::Node &yaml) {
    if (not yaml.IsMap()) {
      return GenesisConfigError::INVALID;
    }
    GenesisConfig genesis;

    if (auto res = readScalar(yaml, "genesis_time", genesis.genesis_time);
        res.has_error()) {
      return GenesisConfigError::INVALID;
    }

    auto yaml_validators = yaml["validators"];
    if (not yaml_validators.IsSequence()) {
      return GenesisConfigError::INVALID;
    }
    std::set<ValidatorId> known;
    for (auto &&yaml_validator : yaml_validators) {
      BOOST_OUTCOME_TRY(auto validator, parseValidator(yaml_validator));
      if (not known.emplace(validator.id).second) {
        return GenesisConfigError::DUPLICATE_VALIDATOR;
      }
      genesis.validators.emplace_back(std::move(validator));
    }
    if (genesis.validators.empty()) {
      return GenesisConfigError::NO_VALIDATORS;
    }

    if (auto consensus = yaml["consensus"]; consensus.IsDefined()) {
      BOOST_OUTCOME_TRY(parseConsensus(consensus, genesis.consensus));
    }
    return genesis;
  }

  outcome::result<GenesisConfig> readGenesisYaml(
      const std::filesystem::path &path) {
    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &) {
      return GenesisConfigError::INVALID;
    }
    return parseGenesisYaml(yaml);
  }

  std::map<ValidatorId, Amount> GenesisConfig::stakes() const {
    std::map<ValidatorId, Amount> stakes;
    for (auto &validator : validators) {
      stakes[validator.id] += validator.stake;
    }
    return stakes;
  }

  Block GenesisConfig::genesisBlock() const {
    qtils::ByteVec state;
    for (auto &[id, stake] : stakes()) {
      state.insert(state.end(), id.begin(), id.end());
      auto le_stake = leBytes(stake);
      state.insert(state.end(), le_stake.begin(), le_stake.end());
    }
    return Block{
        .header =
            BlockHeader{
                .parent_hash = kZeroHash,
                .height = 0,
                .slot = 0,
                .round = 0,
                .state_root = crypto::sha256(state),
                .proposer = {},
                .timestamp = genesis_time,
                .body_root = bodyRootOf(qtils::ByteVec{}),
            },
        .payload = {},
        .signature = {},
    };
  }
}  // namespace keel
