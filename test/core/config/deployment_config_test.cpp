/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/deployment_config.hpp"

#include <gtest/gtest.h>
#include <sstream>

#include "testutil/outcome.hpp"

namespace xr::config {

  class DeploymentConfigTest : public ::testing::Test {
   public:
    outcome::result<DeploymentConfig> parse(
        const std::string &file, std::vector<const char *> args = {}) {
      args.insert(args.begin(), "xraffle_sim");
      std::istringstream stream{file};
      return DeploymentConfig::parse(
          stream, static_cast<int>(args.size()), args.data());
    }
  };

  /**
   * @given config file with the chain selectors only
   * @when parsing it
   * @then defaults are used for everything else
   */
  TEST_F(DeploymentConfigTest, Defaults) {
    EXPECT_OUTCOME_TRUE(config, parse("prize-chain=1\nticket-chain=2\n"));
    EXPECT_EQ(config.prize_chain, 1);
    EXPECT_EQ(config.ticket_chain, 2);
    EXPECT_EQ(config.link_fee, TokenAmount{"100000000000000000"});
    EXPECT_EQ(config.link_funding, TokenAmount{"10000000000000000000"});
    EXPECT_EQ(config.admin, Address::makeFromId(1));
    EXPECT_EQ(config.api_key[0], 0x4c);
    EXPECT_EQ(config.api_key[31], 0x18);
    EXPECT_TRUE(config.extra_args.empty());
    EXPECT_EQ(config.log_level, 'i');
  }

  /**
   * @given option both in the file and on the command line
   * @when parsing
   * @then command line wins
   */
  TEST_F(DeploymentConfigTest, CommandLineOverridesFile) {
    EXPECT_OUTCOME_TRUE(config,
                        parse("prize-chain=1\nticket-chain=2\nlink-fee=5\n",
                              {"--link-fee", "7", "--extra-args", "0x0102"}));
    EXPECT_EQ(config.link_fee, 7);
    EXPECT_EQ(config.extra_args, (Bytes{1, 2}));
  }

  /// Required chain selector is missing
  TEST_F(DeploymentConfigTest, MissingOption) {
    EXPECT_OUTCOME_ERROR(ConfigError::kMissingOption, parse("prize-chain=1\n"));
  }

  /// Unknown option in the file
  TEST_F(DeploymentConfigTest, UnknownOption) {
    EXPECT_OUTCOME_ERROR(
        ConfigError::kInvalidOption,
        parse("prize-chain=1\nticket-chain=2\nprize-manager=3\n"));
  }

  /**
   * @given invalid values
   * @when parsing
   * @then each value is rejected with its own error
   */
  TEST_F(DeploymentConfigTest, InvalidValues) {
    EXPECT_OUTCOME_ERROR(ConfigError::kSameChain,
                         parse("prize-chain=1\nticket-chain=1\n"));
    EXPECT_OUTCOME_ERROR(ConfigError::kZeroChainSelector,
                         parse("prize-chain=0\nticket-chain=1\n"));
    EXPECT_OUTCOME_ERROR(
        ConfigError::kInvalidAmount,
        parse("prize-chain=1\nticket-chain=2\nlink-funding=1e18\n"));
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidHex,
                         parse("prize-chain=1\nticket-chain=2\nadmin=0x01\n"));
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidLogLevel,
                         parse("prize-chain=1\nticket-chain=2\nlog=x\n"));
  }
}  // namespace xr::config
