/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "vm/runtime/env.hpp"

namespace xr::vm::bridge {
  using primitives::ChainSelector;
  using primitives::address::Address;
  using runtime::Env;
  using runtime::OutboundMessage;

  enum class CcipRelayError {
    kUnknownChain = 1,
    kRouterMismatch,
  };

  /**
   * Carries messages between chains. Messages accepted by the router of one
   * chain are delivered through the router of the destination chain.
   * Delivery order and redelivery are up to the caller.
   */
  class CcipRelay {
   public:
    CcipRelay();

    /// Register chain of the environment and its router
    outcome::result<void> addChain(std::shared_ptr<Env> env,
                                   const Address &router);

    /// Messages sent from the chain since the previous fetch
    outcome::result<std::vector<OutboundMessage>> fetch(ChainSelector source);

    /// Deliver the message to its destination chain, may be repeated
    outcome::result<void> deliver(const OutboundMessage &message);

    /**
     * Fetch and deliver pending messages of all chains in send order
     * @return number of delivered messages, or the first delivery error.
     * Messages fetched before the error and not delivered are lost, like a
     * failed execution on a real lane.
     */
    outcome::result<size_t> relayAll();

   private:
    struct Chain {
      std::shared_ptr<Env> env;
      Address router;
      /// Outbox index of the first message not fetched yet
      size_t cursor{};
    };

    std::map<ChainSelector, Chain> chains_;
    common::Logger logger_;
  };
}  // namespace xr::vm::bridge

OUTCOME_HPP_DECLARE_ERROR(xr::vm::bridge, CcipRelayError);
