/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/vrf_coordinator/vrf_coordinator_actor.hpp"

namespace xr::vm::actor::builtin::vrf_coordinator {
  using states::VrfCoordinatorActorState;

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(head, runtime.getActorHead());
    if (head) {
      ABORT(VMExitCode::kSysErrForbidden);
    }
    VrfCoordinatorActorState state;
    state.oracle = runtime.getImmediateCaller();
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(RequestRandomWords) {
    OUTCOME_TRY(state, runtime.getActorState<VrfCoordinatorActorState>());
    const auto request_id = state.next_request_id;
    ++state.next_request_id;
    state.pending[request_id] = runtime.getImmediateCaller();
    OUTCOME_TRY(runtime.commitState(state));
    return request_id;
  }

  ACTOR_METHOD_IMPL(TakeRequest) {
    OUTCOME_TRY(state, runtime.getActorState<VrfCoordinatorActorState>());
    OUTCOME_TRY(runtime.validateImmediateCallerIs(state.oracle));
    const auto it = state.pending.find(params.request_id);
    if (it == state.pending.end()) {
      ABORT(VMExitCode::kRequestNotFound);
    }
    const auto consumer = it->second;
    state.pending.erase(it);
    OUTCOME_TRY(runtime.commitState(state));
    return consumer;
  }
}  // namespace xr::vm::actor::builtin::vrf_coordinator
