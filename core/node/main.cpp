/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>

#include "node/simulation.hpp"

namespace xr {
  void main(const config::DeploymentConfig &config) {
    common::setLogLevel(config.log_level);
    OUTCOME_EXCEPT(deployment, node::Deployment::make(config));
    spdlog::info("prize manager {} on chain {}",
                 deployment.prize_manager.toString(),
                 config.prize_chain);
    spdlog::info("ticket manager {} on chain {}",
                 deployment.ticket_manager.toString(),
                 config.ticket_chain);
    OUTCOME_EXCEPT(report, node::runEthRaffle(deployment, {}));
    std::cout << "winner " << report.winner << ", raised "
              << report.total_raised << " wei, " << report.messages
              << " messages relayed" << std::endl;
  }
}  // namespace xr

int main(int argc, char *argv[]) {
  auto config{xr::config::DeploymentConfig::read(argc, argv)};
  if (!config) {
    std::cerr << config.error().message() << std::endl;
    return EXIT_FAILURE;
  }
  xr::main(config.value());
}
