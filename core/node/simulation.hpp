/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "node/deployment.hpp"

namespace xr::node {
  using primitives::UInt256;

  /// ETH raffle played by a few players
  struct SimulationParams {
    RaffleId raffle_id{1};
    TokenAmount prize{TokenAmount{1} * 1000000000000000000};
    TokenAmount ticket_price{10000000000000000};
    /// Tickets bought by each player, one player per entry
    std::vector<TicketCount> purchases{1, 2, 3};
    primitives::Timestamp duration{3600};
  };

  /// Outcome of a simulated raffle
  struct SimulationReport {
    Address winner;
    TokenAmount total_raised;
    /// Messages carried by the relay
    size_t messages{};
  };

  /**
   * Lock the prize, sell tickets, draw and propagate the winner, then claim
   * the prize on the prize chain
   */
  outcome::result<SimulationReport> runEthRaffle(
      const Deployment &deployment, const SimulationParams &params);
}  // namespace xr::node
