/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor.hpp"
#include "vm/actor/builtin/shared/ccip.hpp"
#include "vm/actor/builtin/shared/roles.hpp"
#include "vm/actor/builtin/types/ticket_manager/raffle.hpp"

namespace xr::vm::actor::builtin::states {
  using primitives::RaffleId;
  using primitives::RequestId;
  using primitives::TokenAmount;
  using primitives::UInt256;
  using primitives::address::Address;
  using types::ticket_manager::Participation;
  using types::ticket_manager::Raffle;
  using types::ticket_manager::RandomnessRequest;

  /// Ticket ledger
  struct TicketManagerActorState : ActorState {
    /// Raffle record, a default one with kNone status if unknown
    Raffle getRaffle(const RaffleId &raffle_id) const;

    Participation getParticipation(const RaffleId &raffle_id,
                                   const Address &player) const;

    UInt256 getNonce(const Address &buyer) const;

    shared::Roles roles;
    shared::CcipConfig ccip;
    /// Ticket collection
    Address tickets;
    /// Randomness coordinator
    Address vrf_coordinator;

    std::map<RaffleId, Raffle> raffles;
    std::map<RequestId, RandomnessRequest> requests;
    /// Next coupon nonce of each buyer
    std::map<Address, UInt256> nonces;
    /// Value paid for tickets of raffles that are not settled yet
    TokenAmount locked_eth{};
  };
}  // namespace xr::vm::actor::builtin::states
