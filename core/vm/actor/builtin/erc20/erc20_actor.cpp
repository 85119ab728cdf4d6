/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/erc20/erc20_actor.hpp"

namespace xr::vm::actor::builtin::erc20 {
  using states::Erc20ActorState;

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(head, runtime.getActorHead());
    if (head) {
      ABORT(VMExitCode::kSysErrForbidden);
    }
    Erc20ActorState state;
    state.owner = runtime.getImmediateCaller();
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(Mint) {
    OUTCOME_TRY(state, runtime.getActorState<Erc20ActorState>());
    OUTCOME_TRY(runtime.validateImmediateCallerIs(state.owner));
    state.balances[params.to] += params.amount;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(Transfer) {
    OUTCOME_TRY(state, runtime.getActorState<Erc20ActorState>());
    const auto from = runtime.getImmediateCaller();
    const auto balance = state.balanceOf(from);
    if (balance < params.amount) {
      ABORT(VMExitCode::kTokenInsufficientBalance);
    }
    state.balances[from] = balance - params.amount;
    state.balances[params.to] += params.amount;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(BalanceOf) {
    OUTCOME_TRY(state, runtime.getActorState<Erc20ActorState>());
    return state.balanceOf(params.owner);
  }
}  // namespace xr::vm::actor::builtin::erc20
