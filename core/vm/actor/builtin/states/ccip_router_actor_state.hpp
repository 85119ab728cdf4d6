/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/blob.hpp"
#include "vm/actor/actor.hpp"

namespace xr::vm::actor::builtin::states {
  using common::Hash256;
  using primitives::ChainSelector;
  using primitives::TokenAmount;
  using primitives::address::Address;

  /// Message accepted for sending, waiting for the relay
  struct OutboundMessage {
    Hash256 message_id;
    ChainSelector source_chain{};
    ChainSelector destination_chain{};
    Address sender;
    Address receiver;
    Bytes data;
    Bytes extra_args;
    TokenAmount fee;
  };

  /// Cross-chain router of one chain
  struct CcipRouterActorState : ActorState {
    /// Allowed to change the fee
    Address owner;
    /// Chain the router runs on
    ChainSelector chain{};
    /// Token fees are charged in
    Address fee_token;
    /// Flat fee per message
    TokenAmount fee;
    uint64_t nonce{};
    /// Every message ever sent, in send order
    std::vector<OutboundMessage> outbox;
  };
}  // namespace xr::vm::actor::builtin::states
