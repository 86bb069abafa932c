/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <yaml-cpp/yaml.h>

#include "crypto/ed25519.hpp"
#include "types/block.hpp"
#include "types/config.hpp"
#include "types/validator.hpp"

namespace keel {
  enum class GenesisConfigError {
    INVALID = 1,
    NO_VALIDATORS,
    INVALID_VALIDATOR,
    DUPLICATE_VALIDATOR,
    INVALID_STAKE,
    INVALID_CONSENSUS_PARAMETER,
  };
  Q_ENUM_ERROR_CODE(GenesisConfigError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID:
        return "Invalid genesis yaml";
      case E::NO_VALIDATORS:
        return "Genesis has no validators";
      case E::INVALID_VALIDATOR:
        return "Genesis validator needs 'seed' or 'pubkey'";
      case E::DUPLICATE_VALIDATOR:
        return "Duplicate genesis validator";
      case E::INVALID_STAKE:
        return "Genesis validator stake must be positive integer";
      case E::INVALID_CONSENSUS_PARAMETER:
        return "Invalid consensus parameter in genesis";
    }
    abort();
  }

  struct GenesisValidator {
    ValidatorId id;
    /// Known only for validators of local test networks
    std::optional<crypto::ed25519::Seed> seed;
    Amount stake = 0;
  };

  /**
   * Genesis of chain: start time, initial stakes and consensus parameters
   * fixed for the whole chain lifetime.
   */
  struct GenesisConfig {
    TimestampMs genesis_time = 0;
    std::vector<GenesisValidator> validators;
    ConsensusConfig consensus;

    /// Block at height 0, committing to initial stakes
    Block genesisBlock() const;

    std::map<ValidatorId, Amount> stakes() const;
  };

  /**
   * 0x-prefixed 64 hex digits are taken as is, any other string is hashed
   * with SHA-256.
   */
  crypto::ed25519::Seed seedFromString(std::string_view value);

  outcome::result<GenesisConfig> parseGenesisYaml(const YAML::Node &yaml);

  outcome::result<GenesisConfig> readGenesisYaml(
      const std::filesystem::path &path);
}  // namespace keel
