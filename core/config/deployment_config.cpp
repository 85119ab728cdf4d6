/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/deployment_config.hpp"

#include <fstream>
#include <functional>
#include <iostream>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options.hpp>

#include "common/blob.hpp"
#include "common/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(xr::config, ConfigError, e) {
  using xr::config::ConfigError;
  switch (e) {
    case ConfigError::kInvalidOption:
      return "ConfigError: invalid option";
    case ConfigError::kMissingOption:
      return "ConfigError: required option is missing";
    case ConfigError::kInvalidHex:
      return "ConfigError: invalid hex value";
    case ConfigError::kInvalidAmount:
      return "ConfigError: amount must be a decimal number";
    case ConfigError::kZeroChainSelector:
      return "ConfigError: chain selector must not be zero";
    case ConfigError::kSameChain:
      return "ConfigError: prize and ticket chains must differ";
    case ConfigError::kInvalidLogLevel:
      return "ConfigError: log level must be one of t,d,i,w,e,c,o";
  }
  return "ConfigError: unknown error";
}

namespace xr::config {
  namespace po = boost::program_options;

  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("config");
      return logger;
    }

    /// Options kept as text until validated
    struct RawConfig {
      std::string config_path;
      std::string link_fee;
      std::string link_funding;
      std::string admin;
      std::string api_key;
      std::string extra_args;
    };

    /// Sample API key of the simulator
    constexpr auto kDefaultApiKey =
        "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";

    po::options_description describe(DeploymentConfig &config,
                                      RawConfig &raw) {
      po::options_description desc("Raffle deployment options");
      auto option{desc.add_options()};
      option("help,h", "print usage message");
      option("config", po::value(&raw.config_path), "read options from file");
      option("prize-chain",
             po::value(&config.prize_chain)->required(),
             "chain selector of the prize chain");
      option("ticket-chain",
             po::value(&config.ticket_chain)->required(),
             "chain selector of the ticket chain");
      option("link-fee",
             po::value(&raw.link_fee)->default_value(config.link_fee.str()),
             "router fee per message, LINK units");
      option("link-funding",
             po::value(&raw.link_funding)
                 ->default_value(config.link_funding.str()),
             "LINK minted to each manager");
      option("start-timestamp",
             po::value(&config.start_timestamp)
                 ->default_value(config.start_timestamp),
             "timestamp of the first block, seconds");
      option("start-block",
             po::value(&config.start_block)->default_value(config.start_block),
             "number of the first block");
      option("admin",
             po::value(&raw.admin)->default_value(config.admin.toString()),
             "admin address of both managers");
      option("api-key",
             po::value(&raw.api_key)->default_value(kDefaultApiKey),
             "private key of the ticket price signer");
      option("extra-args",
             po::value(&raw.extra_args)->default_value("0x"),
             "extra args attached to outbound messages");
      option("log,l",
             po::value(&config.log_level)->default_value(config.log_level),
             "log level, [t,d,i,w,e,c,o]");
      return desc;
    }

    outcome::result<TokenAmount> parseAmount(const std::string &value) {
      if (value.empty()
          || !boost::algorithm::all(value, boost::algorithm::is_digit())) {
        return ConfigError::kInvalidAmount;
      }
      return TokenAmount{value};
    }

    outcome::result<void> validate(DeploymentConfig &config,
                                   const RawConfig &raw) {
      OUTCOME_TRYA(config.link_fee, parseAmount(raw.link_fee));
      OUTCOME_TRYA(config.link_funding, parseAmount(raw.link_funding));

      auto admin = Address::fromString(raw.admin);
      auto api_key = common::Blob<32>::fromHexWithPrefix(raw.api_key);
      auto extra_args = common::unhexWith0x(raw.extra_args);
      if (!admin || !api_key || !extra_args) {
        return ConfigError::kInvalidHex;
      }
      config.admin = admin.value();
      std::copy(
          api_key.value().begin(), api_key.value().end(), config.api_key.begin());
      config.extra_args = std::move(extra_args.value());

      if (config.prize_chain == 0 || config.ticket_chain == 0) {
        return ConfigError::kZeroChainSelector;
      }
      if (config.prize_chain == config.ticket_chain) {
        return ConfigError::kSameChain;
      }
      if (std::string{"tdiweco"}.find(config.log_level) == std::string::npos) {
        return ConfigError::kInvalidLogLevel;
      }
      return outcome::success();
    }

    outcome::result<DeploymentConfig> parseWith(
        const std::function<void(po::options_description &,
                                 po::variables_map &,
                                 RawConfig &)> &store) {
      DeploymentConfig config;
      RawConfig raw;
      auto desc{describe(config, raw)};
      try {
        po::variables_map vm;
        store(desc, vm, raw);
        po::notify(vm);
      } catch (const po::required_option &e) {
        logger()->error("{}", e.what());
        return ConfigError::kMissingOption;
      } catch (const po::error &e) {
        logger()->error("{}", e.what());
        return ConfigError::kInvalidOption;
      }
      OUTCOME_TRY(validate(config, raw));
      return config;
    }
  }  // namespace

  outcome::result<DeploymentConfig> DeploymentConfig::read(
      int argc, const char *const argv[]) {
    return parseWith([&](auto &desc, auto &vm, auto &) {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      if (vm.count("help") != 0) {
        std::cerr << desc << std::endl;
      }
      if (vm.count("config") != 0) {
        std::ifstream file{vm["config"].template as<std::string>()};
        if (!file.good()) {
          throw po::error{"cannot open config file"};
        }
        po::store(po::parse_config_file(file, desc), vm);
      }
    });
  }

  outcome::result<DeploymentConfig> DeploymentConfig::parse(
      std::istream &file, int argc, const char *const argv[]) {
    return parseWith([&](auto &desc, auto &vm, auto &) {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::store(po::parse_config_file(file, desc), vm);
    });
  }
}  // namespace xr::config
