/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>
#include <boost/program_options.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/configuration.hpp"

#ifndef KEEL_VERSION
#define KEEL_VERSION "undefined"
#endif

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    BOOST_ASSERT(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

  constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: keel
        children:
          - name: validators
          - name: leader
          - name: fork_choice
          - name: finality
          - name: checkpoint
          - name: slashing
          - name: rewards
          - name: consensus
          - name: app
)yaml";

}  // namespace

namespace keel::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = KEEL_VERSION;
    config_->name_ = "keel-local";

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("genesis", po::value<std::string>(), "Set path to genesis yaml file.")
        ("name,n", po::value<std::string>(), "Set name of node.")
        ("node-key", po::value<std::string>(), "Seed of validator whose view is reported, as written in genesis file.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lfinality=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description simulation_options("Local network options");
    simulation_options.add_options()
        ("slots", po::value<uint64_t>()->default_value(config_->simulation_.slots), "Number of slots to run.")
        ("offline", po::value<std::vector<size_t>>()->multitoken(), "Genesis indices of validators which stay silent.")
        ("shuffle-seed", po::value<uint64_t>(), "Deliver messages in pseudo-random order seeded by this value.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(simulation_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Keel node version " << KEEL_VERSION << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Keel node version " << KEEL_VERSION << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    BOOST_OUTCOME_TRY(initGeneralConfig());
    BOOST_OUTCOME_TRY(initSimulationConfig());

    return config_;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto name = section["name"];
          if (name.IsDefined()) {
            if (name.IsScalar()) {
              config_->name_ = name.as<std::string>();
            } else {
              file_errors_ << "E: Value 'general.name' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto node_key = section["node-key"];
          if (node_key.IsDefined()) {
            if (node_key.IsScalar()) {
              auto value = node_key.as<std::string>();
              boost::trim(value);
              if (value.empty()) {
                config_->node_key_.reset();
              } else {
                config_->node_key_ = value;
              }
            } else {
              file_errors_ << "E: Value 'general.node-key' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto genesis = section["genesis"];
          if (genesis.IsDefined()) {
            if (genesis.IsScalar()) {
              config_->genesis_config_path_ = genesis.as<std::string>();
            } else {
              file_errors_ << "E: Value 'general.genesis' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }
    BOOST_OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "node-key", [&](const std::string &value) {
          auto trimmed = value;
          boost::trim(trimmed);
          if (trimmed.empty()) {
            config_->node_key_.reset();
          } else {
            config_->node_key_ = trimmed;
          }
        });
    find_argument<std::string>(
        cli_values_map_, "genesis", [&](const std::string &value) {
          config_->genesis_config_path_ = value;
        });

    // Check values
    if (config_->genesis_config_path_.empty()) {
      SL_ERROR(logger_, "The 'genesis' path must be provided");
      return Error::InvalidValue;
    }
    config_->genesis_config_path_ =
        std::filesystem::weakly_canonical(config_->genesis_config_path_);
    if (not is_regular_file(config_->genesis_config_path_)) {
      SL_ERROR(logger_,
               "The 'genesis' file does not exist or is not a file: {}",
               config_->genesis_config_path_.c_str());
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initSimulationConfig() {
    auto &simulation = config_->simulation_;
    if (config_file_.has_value()) {
      auto section = (*config_file_)["simulation"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto slots = section["slots"];
          if (slots.IsDefined()) {
            if (slots.IsScalar()) {
              simulation.slots = slots.as<uint64_t>();
            } else {
              file_errors_ << "E: Value 'simulation.slots' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto offline = section["offline"];
          if (offline.IsDefined()) {
            if (offline.IsSequence()) {
              simulation.offline = offline.as<std::vector<size_t>>();
            } else {
              file_errors_
                  << "E: Value 'simulation.offline' must be sequence\n";
              file_has_error_ = true;
            }
          }
          auto shuffle_seed = section["shuffle-seed"];
          if (shuffle_seed.IsDefined()) {
            if (shuffle_seed.IsScalar()) {
              simulation.shuffle_seed = shuffle_seed.as<uint64_t>();
            } else {
              file_errors_
                  << "E: Value 'simulation.shuffle-seed' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'simulation' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }
    BOOST_OUTCOME_TRY(reportFileErrors());

    find_argument<uint64_t>(
        cli_values_map_, "slots", [&](const uint64_t &value) {
          simulation.slots = value;
        });
    find_argument<std::vector<size_t>>(
        cli_values_map_, "offline", [&](const std::vector<size_t> &value) {
          simulation.offline = value;
        });
    if (auto seed = find_argument<uint64_t>(cli_values_map_, "shuffle-seed")) {
      simulation.shuffle_seed = seed;
    }

    if (simulation.slots == 0) {
      SL_ERROR(logger_, "The 'slots' value must be positive");
      return Error::InvalidValue;
    }
    return outcome::success();
  }

}  // namespace keel::app
