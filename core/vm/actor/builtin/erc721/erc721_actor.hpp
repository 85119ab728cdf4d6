/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/states/erc721_actor_state.hpp"

/// Minimal NFT collection without approvals
namespace xr::vm::actor::builtin::erc721 {
  using primitives::TokenId;
  using primitives::address::Address;

  struct Construct : ActorMethodBase<1> {
    ACTOR_METHOD_DECL();
  };

  /// Owner only, token id must be new
  struct Mint : ActorMethodBase<2> {
    struct Params {
      Address to;
      TokenId token_id;
    };
    ACTOR_METHOD_DECL();
  };

  /// Callable by the current holder of the token
  struct TransferFrom : ActorMethodBase<3> {
    struct Params {
      Address from;
      Address to;
      TokenId token_id;
    };
    ACTOR_METHOD_DECL();
  };

  struct OwnerOf : ActorMethodBase<4> {
    struct Params {
      TokenId token_id;
    };
    using Result = Address;
    ACTOR_METHOD_DECL();
  };
}  // namespace xr::vm::actor::builtin::erc721
