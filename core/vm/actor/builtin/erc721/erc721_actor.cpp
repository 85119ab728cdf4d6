/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/erc721/erc721_actor.hpp"

namespace xr::vm::actor::builtin::erc721 {
  using states::Erc721ActorState;

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(head, runtime.getActorHead());
    if (head) {
      ABORT(VMExitCode::kSysErrForbidden);
    }
    Erc721ActorState state;
    state.owner = runtime.getImmediateCaller();
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(Mint) {
    OUTCOME_TRY(state, runtime.getActorState<Erc721ActorState>());
    OUTCOME_TRY(runtime.validateImmediateCallerIs(state.owner));
    if (params.to.isZero() || !state.ownerOf(params.token_id).isZero()) {
      ABORT(VMExitCode::kSysErrIllegalArgument);
    }
    state.owners[params.token_id] = params.to;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(TransferFrom) {
    OUTCOME_TRY(state, runtime.getActorState<Erc721ActorState>());
    const auto owner = state.ownerOf(params.token_id);
    if (owner.isZero() || owner != params.from
        || owner != runtime.getImmediateCaller()) {
      ABORT(VMExitCode::kNotTokenOwner);
    }
    state.owners[params.token_id] = params.to;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(OwnerOf) {
    OUTCOME_TRY(state, runtime.getActorState<Erc721ActorState>());
    return state.ownerOf(params.token_id);
  }
}  // namespace xr::vm::actor::builtin::erc721
