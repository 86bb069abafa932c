/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "utils/ctor_limiters.hpp"

namespace keel::app {
  class Configuration : Singleton<Configuration> {
   public:
    struct SimulationConfig {
      /// Number of slots to run
      uint64_t slots = 64;
      /// Genesis indices of validators which never send anything
      std::vector<size_t> offline;
      /// Shuffles delivery order when set
      std::optional<uint64_t> shuffle_seed;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::filesystem::path &genesisConfigPath()
        const;
    /// Seed of reported validator, as in genesis file
    [[nodiscard]] virtual const std::optional<std::string> &nodeKey() const;

    [[nodiscard]] virtual const SimulationConfig &simulation() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path genesis_config_path_;
    std::optional<std::string> node_key_;

    SimulationConfig simulation_;
  };

}  // namespace keel::app
