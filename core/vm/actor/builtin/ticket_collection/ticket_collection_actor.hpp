/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/states/ticket_collection_actor_state.hpp"

/**
 * Ticket token. Each raffle id is a token id, tickets are issued in batches
 * and only the start of a batch is recorded.
 */
namespace xr::vm::actor::builtin::ticket_collection {
  using primitives::RaffleId;
  using primitives::TicketCount;
  using primitives::TicketSupply;
  using primitives::address::Address;

  /// The caller becomes the owner
  struct Construct : ActorMethodBase<1> {
    struct Params {
      Address minter;
    };
    ACTOR_METHOD_DECL();
  };

  /// Minter only
  struct Mint : ActorMethodBase<2> {
    struct Params {
      Address to;
      RaffleId raffle_id;
      TicketCount count;
    };
    ACTOR_METHOD_DECL();
  };

  struct SupplyOf : ActorMethodBase<3> {
    struct Params {
      RaffleId raffle_id;
    };
    using Result = TicketSupply;
    ACTOR_METHOD_DECL();
  };

  /// Fails with kInexistentTicket for a ticket not issued yet
  struct OwnerOf : ActorMethodBase<4> {
    struct Params {
      RaffleId raffle_id;
      TicketSupply ticket;
    };
    using Result = Address;
    ACTOR_METHOD_DECL();
  };

  struct BalanceOf : ActorMethodBase<5> {
    struct Params {
      RaffleId raffle_id;
      Address owner;
    };
    using Result = uint64_t;
    ACTOR_METHOD_DECL();
  };

  /// Owner only
  struct SetMinter : ActorMethodBase<6> {
    struct Params {
      Address minter;
    };
    ACTOR_METHOD_DECL();
  };
}  // namespace xr::vm::actor::builtin::ticket_collection
