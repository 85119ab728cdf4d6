/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/states/ticket_collection_actor_state.hpp"

namespace xr::vm::actor::builtin::states {
  boost::optional<Address> TicketCollectionActorState::ownerOf(
      const RaffleId &raffle_id, TicketSupply n) const {
    const auto raffle = raffles.find(raffle_id);
    if (raffle == raffles.end() || n >= raffle->second.supply) {
      return boost::none;
    }
    // first batch starts at zero, so there is always one at or before n
    auto batch = raffle->second.batches.upper_bound(n);
    --batch;
    return batch->second;
  }

  TicketSupply TicketCollectionActorState::supplyOf(
      const RaffleId &raffle_id) const {
    const auto raffle = raffles.find(raffle_id);
    return raffle == raffles.end() ? 0 : raffle->second.supply;
  }

  uint64_t TicketCollectionActorState::balanceOf(const RaffleId &raffle_id,
                                                 const Address &owner) const {
    const auto raffle = raffles.find(raffle_id);
    if (raffle == raffles.end()) {
      return 0;
    }
    const auto it = raffle->second.balances.find(owner);
    return it == raffle->second.balances.end() ? 0 : it->second;
  }
}  // namespace xr::vm::actor::builtin::states
