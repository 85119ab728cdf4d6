/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include <boost/optional.hpp>

#include "vm/actor/actor.hpp"

namespace xr::vm::actor::builtin::states {
  using primitives::RaffleId;
  using primitives::TicketSupply;
  using primitives::address::Address;

  /// Tickets of a single raffle, numbered from zero in issue order
  struct RaffleTickets {
    TicketSupply supply{};
    /// Owner of each minted batch by the number of its first ticket
    std::map<TicketSupply, Address> batches;
    std::map<Address, uint64_t> balances;
  };

  /// Ticket token, one id per raffle
  struct TicketCollectionActorState : ActorState {
    /// Owner of ticket n, the holder of the batch it belongs to
    boost::optional<Address> ownerOf(const RaffleId &raffle_id,
                                     TicketSupply n) const;

    TicketSupply supplyOf(const RaffleId &raffle_id) const;

    uint64_t balanceOf(const RaffleId &raffle_id, const Address &owner) const;

    /// May change the minter
    Address owner;
    /// Ticket manager allowed to mint
    Address minter;
    std::map<RaffleId, RaffleTickets> raffles;
  };
}  // namespace xr::vm::actor::builtin::states
