/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace keel::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        simulation_{
            .slots = 64,
            .offline = {},
            .shuffle_seed = std::nullopt,
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::filesystem::path &Configuration::genesisConfigPath() const {
    return genesis_config_path_;
  }

  const std::optional<std::string> &Configuration::nodeKey() const {
    return node_key_;
  }

  const Configuration::SimulationConfig &Configuration::simulation() const {
    return simulation_;
  }

}  // namespace keel::app
