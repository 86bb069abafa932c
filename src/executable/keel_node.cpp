/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <iostream>
#include <memory>
#include <ranges>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "app/local_network.hpp"
#include "blockchain/finalized_block_stream.hpp"
#include "blockchain/genesis_config.hpp"
#include "blockchain/impl/in_memory_consensus_records.hpp"
#include "blockchain/impl/in_memory_stake_treasury.hpp"
#include "consensus/consensus_engine.hpp"
#include "log/logger.hpp"

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using keel::app::Configuration;
  using keel::app::LocalNetwork;
  using keel::consensus::ConsensusEngine;
  using keel::log::LoggingSystem;

  struct LocalNode {
    size_t index;
    keel::ValidatorId id;
    std::shared_ptr<keel::FinalizedBlockStream> finalized;
    std::shared_ptr<ConsensusEngine> engine;
  };

  void print_report(const keel::GenesisConfig &genesis,
                    const LocalNode &node) {
    auto &engine = *node.engine;
    fmt::print("Report of validator #{} {:0x}\n", node.index, node.id);

    auto cursor = node.finalized->cursor(0);
    fmt::print("Finalized chain:\n");
    while (auto block = cursor.next()) {
      auto &header = block->header;
      fmt::print("  #{} {:0x} slot {} round {} proposer {:0x}\n",
                   header.height,
                   block->hash(),
                   header.slot,
                   header.round,
                   header.proposer);
    }

    if (auto checkpoint = engine.latestCheckpoint()) {
      fmt::print("Latest checkpoint: {}\n", *checkpoint);
    }

    auto slashings = engine.slashings();
    fmt::print("Slashing events: {}\n", slashings.size());
    for (auto &record : slashings) {
      fmt::print("  {} by {:0x} at height {}: penalty {}, stake left {}\n",
                   record.evidence.offense,
                   record.evidence.offender,
                   record.evidence.height,
                   record.penalty,
                   record.stake_after);
    }

    fmt::print("Validators in epoch {}:\n", engine.epoch());
    for (auto &genesis_validator : genesis.validators) {
      if (auto validator = engine.validator(genesis_validator.id)) {
        fmt::print("  {:0x} {} stake {} power {} cast {} missed {}\n",
                     validator->id,
                     validator->status,
                     validator->stake,
                     validator->voting_power,
                     validator->votes_cast,
                     validator->votes_missed);
      }
    }
  }

  int run_network(std::shared_ptr<LoggingSystem> logsys,
                  std::shared_ptr<Configuration> appcfg) {
    auto logger = logsys->getLogger("LocalNetwork", "app");

    auto genesis_res = keel::readGenesisYaml(appcfg->genesisConfigPath());
    if (genesis_res.has_error()) {
      SL_CRITICAL(logger,
                  "Failed to read genesis {}: {}",
                  appcfg->genesisConfigPath().c_str(),
                  genesis_res.error());
      return EXIT_FAILURE;
    }
    auto &genesis = genesis_res.value();
    auto genesis_block = genesis.genesisBlock();
    auto &simulation = appcfg->simulation();

    auto network =
        std::make_shared<LocalNetwork>(logsys, simulation.shuffle_seed);
    std::vector<LocalNode> nodes;
    for (size_t index = 0; index < genesis.validators.size(); ++index) {
      auto &validator = genesis.validators[index];
      if (not validator.seed
          or std::ranges::find(simulation.offline, index)
                 != simulation.offline.end()) {
        SL_INFO(logger, "Validator #{} {:0x} is offline", index, validator.id);
        continue;
      }
      auto finalized = std::make_shared<keel::FinalizedBlockStream>();
      auto engine = std::make_shared<ConsensusEngine>(
          logsys,
          genesis.consensus,
          genesis_block,
          std::make_shared<keel::InMemoryStakeTreasury>(genesis.stakes()),
          std::make_shared<keel::InMemoryConsensusRecords>(),
          finalized,
          network->endpoint(index),
          keel::crypto::ed25519::keypairFromSeed(*validator.seed));
      network->attach(index, engine);
      nodes.emplace_back(LocalNode{
          .index = index,
          .id = validator.id,
          .finalized = std::move(finalized),
          .engine = std::move(engine),
      });
    }
    if (nodes.empty()) {
      SL_CRITICAL(logger, "No validator with known seed is online");
      return EXIT_FAILURE;
    }

    auto reported = nodes.begin();
    if (auto &node_key = appcfg->nodeKey()) {
      auto id = keel::crypto::ed25519::publicKey(
          keel::crypto::ed25519::keypairFromSeed(
              keel::seedFromString(*node_key)));
      reported = std::ranges::find(nodes, id, &LocalNode::id);
      if (reported == nodes.end()) {
        SL_CRITICAL(logger, "Node key does not belong to online validator");
        return EXIT_FAILURE;
      }
    }

    auto &config = genesis.consensus;
    for (keel::Slot slot = 1; slot <= simulation.slots; ++slot) {
      for (auto &node : nodes) {
        if (auto res = node.engine->onSlot(slot); res.has_error()) {
          SL_ERROR(logger,
                   "Validator #{} failed at slot {}: {}",
                   node.index,
                   slot,
                   res.error());
        }
      }
      network->pump();

      // Silent leader: backups take over one timeout after another
      for (keel::Round round = 1;
           round <= config.backup_count
           and reported->engine->headHeader().slot < slot;
           ++round) {
        for (auto &node : nodes) {
          auto res =
              node.engine->onLeaderTimeout(slot, round * config.leader_timeout_ms);
          if (res.has_error()) {
            SL_ERROR(logger,
                     "Validator #{} failed on leader timeout: {}",
                     node.index,
                     res.error());
          }
        }
        network->pump();
      }

      if (reported->engine->isHalted()) {
        SL_CRITICAL(logger, "Finalization halted at slot {}", slot);
        break;
      }
    }

    auto finalized = reported->engine->latestFinalized();
    SL_INFO(logger,
            "Finished {} slots: head {:0x}, finalized {} at height {}",
            simulation.slots,
            reported->engine->head(),
            finalized.block_hash,
            finalized.height);
    print_report(genesis, *reported);

    return reported->engine->isHalted() ? EXIT_FAILURE : EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("keel-node");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<keel::app::Configurator>(argc, argv, env);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<keel::log::LoggingSystem>(std::move(logging_system));
  });

  if (auto res = logging_system->tuneLoggingSystem(
          app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::print(std::cerr, "Bad logging filter: {}\n", res.error());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "keel");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::print(std::cerr, "Failed to calculate config: {}\n", error);
      fmt::print(std::cerr, "See more details in the log\n");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  auto logger = logging_system->getLogger("Main", keel::log::defaultGroupName);
  SL_INFO(logger,
          "Keel node '{}' started. Version: {}",
          app_configuration->nodeName(),
          app_configuration->nodeVersion());

  auto exit_code = run_network(logging_system, app_configuration);

  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}
