/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/states/ticket_manager_actor_state.hpp"

namespace xr::vm::actor::builtin::states {
  Raffle TicketManagerActorState::getRaffle(const RaffleId &raffle_id) const {
    const auto it = raffles.find(raffle_id);
    if (it == raffles.end()) {
      return {};
    }
    return it->second;
  }

  Participation TicketManagerActorState::getParticipation(
      const RaffleId &raffle_id, const Address &player) const {
    const auto raffle = raffles.find(raffle_id);
    if (raffle == raffles.end()) {
      return {};
    }
    const auto it = raffle->second.participations.find(player);
    if (it == raffle->second.participations.end()) {
      return {};
    }
    return it->second;
  }

  UInt256 TicketManagerActorState::getNonce(const Address &buyer) const {
    const auto it = nonces.find(buyer);
    return it == nonces.end() ? UInt256{0} : it->second;
  }
}  // namespace xr::vm::actor::builtin::states
