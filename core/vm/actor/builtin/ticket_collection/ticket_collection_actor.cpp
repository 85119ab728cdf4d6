/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/ticket_collection/ticket_collection_actor.hpp"

namespace xr::vm::actor::builtin::ticket_collection {
  using states::TicketCollectionActorState;

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(head, runtime.getActorHead());
    if (head) {
      ABORT(VMExitCode::kSysErrForbidden);
    }
    TicketCollectionActorState state;
    state.owner = runtime.getImmediateCaller();
    state.minter = params.minter;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(Mint) {
    OUTCOME_TRY(state, runtime.getActorState<TicketCollectionActorState>());
    OUTCOME_TRY(runtime.validateImmediateCallerIs(state.minter));
    if (params.count == 0 || params.to.isZero()) {
      ABORT(VMExitCode::kSysErrIllegalArgument);
    }
    auto &tickets = state.raffles[params.raffle_id];
    tickets.batches[tickets.supply] = params.to;
    tickets.supply += params.count;
    tickets.balances[params.to] += params.count;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(SupplyOf) {
    OUTCOME_TRY(state, runtime.getActorState<TicketCollectionActorState>());
    return state.supplyOf(params.raffle_id);
  }

  ACTOR_METHOD_IMPL(OwnerOf) {
    OUTCOME_TRY(state, runtime.getActorState<TicketCollectionActorState>());
    const auto owner = state.ownerOf(params.raffle_id, params.ticket);
    if (!owner) {
      ABORT(VMExitCode::kInexistentTicket);
    }
    return *owner;
  }

  ACTOR_METHOD_IMPL(BalanceOf) {
    OUTCOME_TRY(state, runtime.getActorState<TicketCollectionActorState>());
    return state.balanceOf(params.raffle_id, params.owner);
  }

  ACTOR_METHOD_IMPL(SetMinter) {
    OUTCOME_TRY(state, runtime.getActorState<TicketCollectionActorState>());
    OUTCOME_TRY(runtime.validateImmediateCallerIs(state.owner));
    if (params.minter.isZero()) {
      ABORT(VMExitCode::kSysErrIllegalArgument);
    }
    state.minter = params.minter;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }
}  // namespace xr::vm::actor::builtin::ticket_collection
