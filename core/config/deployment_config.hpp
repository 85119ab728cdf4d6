/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>

#include "crypto/secp256k1/secp256k1_types.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace xr::config {
  using crypto::secp256k1::PrivateKey;
  using primitives::BlockNumber;
  using primitives::ChainSelector;
  using primitives::Timestamp;
  using primitives::TokenAmount;
  using primitives::address::Address;

  enum class ConfigError {
    kInvalidOption = 1,
    kMissingOption,
    kInvalidHex,
    kInvalidAmount,
    kZeroChainSelector,
    kSameChain,
    kInvalidLogLevel,
  };

  /// Two chain deployment of the raffle
  struct DeploymentConfig {
    ChainSelector prize_chain{};
    ChainSelector ticket_chain{};
    /// Router fee in LINK per message
    TokenAmount link_fee{100000000000000000};
    /// LINK minted to each manager
    TokenAmount link_funding{TokenAmount{10} * 1000000000000000000};
    Timestamp start_timestamp{1700000000};
    BlockNumber start_block{1};
    Address admin{Address::makeFromId(1)};
    /// Key of the ticket price signer
    PrivateKey api_key{};
    Bytes extra_args;
    char log_level{'i'};

    /**
     * Parse command line, then the config file named by --config if any.
     * Command line takes precedence.
     */
    static outcome::result<DeploymentConfig> read(int argc,
                                                  const char *const argv[]);

    /// Parse config file in ini syntax, then the command line over it
    static outcome::result<DeploymentConfig> parse(std::istream &file,
                                                   int argc,
                                                   const char *const argv[]);
  };
}  // namespace xr::config

OUTCOME_HPP_DECLARE_ERROR(xr::config, ConfigError);
