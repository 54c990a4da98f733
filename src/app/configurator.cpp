/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <print>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>
#include <soralog/macro.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "types/constants.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(taiko::app, Configurator::Error, e) {
  using E = taiko::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown app::Configurator::Error");
}

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

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

  /// "<chain id>.<name>", chain id is decimal
  bool isAddressKey(std::string_view key) {
    auto dot = key.find('.');
    if (dot == std::string_view::npos or dot == 0 or dot + 1 == key.size()) {
      return false;
    }
    uint64_t chain_id = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + dot, chain_id);
    return ec == std::errc{} and ptr == key.data() + dot;
  }
}  // namespace

namespace taiko::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "noname";

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("scenario,s", po::value<std::string>(), "Set path to scenario yaml-file to replay.")
        ("name,n", po::value<std::string>(), "Set name of node.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lForkChoice=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description protocol_options("Protocol options");
    protocol_options.add_options()
        ("oracle-prover", "Enable oracle prover fast path.")
        ("no-anchor-validation", "Skip anchor transaction checks.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(protocol_options);
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
      std::println(std::cout, "Taiko finality version {}", buildVersion());
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::println(std::cout, "Taiko finality version {}", buildVersion());
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
        cli_values_map_, "log", [&](const std::vector<std::string> &value) {
          logger_cli_args_ = value;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: none
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: taiko
        children:
          - name: injector
          - name: application
)yaml";

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
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initProtocolConfig());
    OUTCOME_TRY(initAddresses());

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
          auto scenario = section["scenario"];
          if (scenario.IsDefined()) {
            if (scenario.IsScalar()) {
              config_->scenario_file_ = scenario.as<std::string>();
            } else {
              file_errors_ << "E: Value 'general.scenario' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "scenario", [&](const std::string &value) {
          config_->scenario_file_ = value;
        });

    if (config_->scenario_file_.has_value()) {
      auto path = std::filesystem::weakly_canonical(*config_->scenario_file_);
      if (not std::filesystem::is_regular_file(path)) {
        SL_ERROR(logger_, "Scenario file {} does not exist", path.native());
        return Error::InvalidValue;
      }
      config_->scenario_file_ = path;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initProtocolConfig() {
    auto &protocol = config_->protocol_;

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["protocol"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto read = [&]<typename T>(const char *key, T &field) {
            auto node = section[key];
            if (not node.IsDefined()) {
              return;
            }
            if (not node.IsScalar()) {
              file_errors_ << "E: Value 'protocol." << key
                           << "' must be scalar\n";
              file_has_error_ = true;
              return;
            }
            try {
              field = node.as<T>();
            } catch (const YAML::Exception &e) {
              file_errors_ << "E: Value 'protocol." << key
                           << "' is invalid: " << e.what() << "\n";
              file_has_error_ = true;
            }
          };
          read("chain-id", protocol.chain_id);
          read("l1-chain-id", protocol.l1_chain_id);
          read("max-num-blocks", protocol.max_num_blocks);
          read("zk-proofs-per-block", protocol.zk_proofs_per_block);
          read("max-proofs-per-fork-choice",
               protocol.max_proofs_per_fork_choice);
          read("anchor-tx-gas-limit", protocol.anchor_tx_gas_limit);
          read("uncle-proof-window", protocol.uncle_proof_window);
          read("enable-oracle-prover", protocol.enable_oracle_prover);
          read("enable-anchor-validation", protocol.enable_anchor_validation);
          read("fork-choice-capacity", protocol.fork_choice_capacity);
        } else {
          file_errors_ << "E: Section 'protocol' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    if (find_argument(cli_values_map_, "oracle-prover")) {
      protocol.enable_oracle_prover = true;
    }
    if (find_argument(cli_values_map_, "no-anchor-validation")) {
      protocol.enable_anchor_validation = false;
    }

    if (protocol.max_num_blocks < 2) {
      SL_ERROR(logger_, "'max-num-blocks' must be at least 2");
      return Error::InvalidValue;
    }
    if (protocol.max_proofs_per_fork_choice == 0) {
      SL_ERROR(logger_, "'max-proofs-per-fork-choice' must not be zero");
      return Error::InvalidValue;
    }
    if (protocol.zk_proofs_per_block > MAX_CIRCUITS_PER_EVIDENCE
        or protocol.zk_proofs_per_block + 2 > MAX_PROOFS_PER_EVIDENCE) {
      SL_ERROR(logger_,
               "'zk-proofs-per-block' must not exceed {}",
               MAX_PROOFS_PER_EVIDENCE - 2);
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initAddresses() {
    if (not config_file_.has_value()) {
      return outcome::success();
    }
    auto section = (*config_file_)["addresses"];
    if (not section.IsDefined()) {
      return outcome::success();
    }
    if (not section.IsMap()) {
      file_errors_ << "E: Section 'addresses' defined, but is not map\n";
      file_has_error_ = true;
      return reportFileErrors();
    }

    for (auto it = section.begin(); it != section.end(); ++it) {
      auto key = it->first.as<std::string>();
      if (not isAddressKey(key)) {
        file_errors_ << "E: Key 'addresses." << key
                     << "' must be <chain-id>.<name>\n";
        file_has_error_ = true;
        continue;
      }
      if (not it->second.IsScalar()) {
        file_errors_ << "E: Value 'addresses." << key << "' must be scalar\n";
        file_has_error_ = true;
        continue;
      }
      auto hex = it->second.as<std::string>();
      boost::trim(hex);
      auto address = Address::fromHexWithPrefix(hex);
      if (not address.has_value()) {
        file_errors_ << "E: Value 'addresses." << key
                     << "' must be 0x-prefixed 20 bytes hex\n";
        file_has_error_ = true;
        continue;
      }
      config_->addresses_.insert_or_assign(key, address.value());
    }

    return reportFileErrors();
  }

}  // namespace taiko::app
