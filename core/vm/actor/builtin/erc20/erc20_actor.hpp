/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/states/erc20_actor_state.hpp"

/// Minimal fungible token, LINK and prize tokens are instances of it
namespace xr::vm::actor::builtin::erc20 {
  using primitives::TokenAmount;
  using primitives::address::Address;

  struct Construct : ActorMethodBase<1> {
    ACTOR_METHOD_DECL();
  };

  /// Owner only
  struct Mint : ActorMethodBase<2> {
    struct Params {
      Address to;
      TokenAmount amount;
    };
    ACTOR_METHOD_DECL();
  };

  struct Transfer : ActorMethodBase<3> {
    struct Params {
      Address to;
      TokenAmount amount;
    };
    ACTOR_METHOD_DECL();
  };

  struct BalanceOf : ActorMethodBase<4> {
    struct Params {
      Address owner;
    };
    using Result = TokenAmount;
    ACTOR_METHOD_DECL();
  };
}  // namespace xr::vm::actor::builtin::erc20
