/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/states/ccip_router_actor_state.hpp"

/**
 * Sending end of the cross-chain channel. Messages are kept in the outbox,
 * delivery on the destination chain is done by the relay.
 */
namespace xr::vm::actor::builtin::ccip_router {
  using common::Hash256;
  using primitives::ChainSelector;
  using primitives::TokenAmount;
  using primitives::address::Address;
  using runtime::Evm2AnyMessage;

  struct Construct : ActorMethodBase<1> {
    struct Params {
      ChainSelector chain;
      Address fee_token;
      TokenAmount fee;
    };
    ACTOR_METHOD_DECL();
  };

  /// Owner only
  struct SetFee : ActorMethodBase<2> {
    struct Params {
      TokenAmount fee;
    };
    ACTOR_METHOD_DECL();
  };

  struct GetFee : ActorMethodBase<3> {
    struct Params {
      ChainSelector destination_chain;
      Evm2AnyMessage message;
    };
    using Result = TokenAmount;
    ACTOR_METHOD_DECL();
  };

  /// Queue the message, the caller is the sender
  struct CcipSend : ActorMethodBase<4> {
    struct Params {
      ChainSelector destination_chain;
      Evm2AnyMessage message;
    };
    using Result = Hash256;
    ACTOR_METHOD_DECL();
  };
}  // namespace xr::vm::actor::builtin::ccip_router
