/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "config/deployment_config.hpp"
#include "vm/bridge/ccip_relay.hpp"

namespace xr::node {
  using config::DeploymentConfig;
  using crypto::secp256k1::PrivateKey;
  using primitives::BlockNumber;
  using primitives::ChainSelector;
  using primitives::RaffleId;
  using primitives::TicketCount;
  using primitives::TokenAmount;
  using primitives::address::Address;
  using vm::bridge::CcipRelay;
  using vm::runtime::Env;

  /// Collaborators of one chain
  struct ChainContracts {
    std::shared_ptr<Env> env;
    Address link;
    Address router;
  };

  /**
   * Prize manager on the prize chain and ticket manager on the ticket chain,
   * both funded with LINK and registered as counterparts of each other
   */
  struct Deployment {
    static outcome::result<Deployment> make(const DeploymentConfig &config);

    /**
     * Coupon of the API signer authorizing the purchase
     * @return compact signature with recovery id
     */
    outcome::result<Bytes> signCoupon(const Address &buyer,
                                      const RaffleId &raffle_id,
                                      TicketCount count,
                                      BlockNumber valid_until,
                                      const TokenAmount &value) const;

    /// Move time forward on both chains
    void advanceTime(primitives::Timestamp seconds) const;

    ChainContracts prize_chain;
    ChainContracts ticket_chain;
    Address admin;
    Address api;
    PrivateKey api_key{};
    /// Fulfills randomness requests of the coordinator
    Address vrf_oracle;
    Address prize_manager;
    Address ticket_manager;
    Address tickets;
    Address vrf_coordinator;
    std::shared_ptr<CcipRelay> relay;
  };
}  // namespace xr::node
