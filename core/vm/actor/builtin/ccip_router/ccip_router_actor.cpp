/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/ccip_router/ccip_router_actor.hpp"

#include "codec/abi/abi_packed.hpp"
#include "crypto/sha/sha256.hpp"

namespace xr::vm::actor::builtin::ccip_router {
  using states::CcipRouterActorState;
  using states::OutboundMessage;

  namespace {
    outcome::result<void> checkMessage(const CcipRouterActorState &state,
                                       ChainSelector destination_chain,
                                       const Evm2AnyMessage &message) {
      if (destination_chain == 0 || destination_chain == state.chain
          || message.receiver.isZero()) {
        ABORT(VMExitCode::kSysErrIllegalArgument);
      }
      if (message.fee_token != state.fee_token) {
        ABORT(VMExitCode::kSysErrIllegalArgument);
      }
      return outcome::success();
    }
  }  // namespace

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(head, runtime.getActorHead());
    if (head) {
      ABORT(VMExitCode::kSysErrForbidden);
    }
    CcipRouterActorState state;
    state.owner = runtime.getImmediateCaller();
    state.chain = params.chain;
    state.fee_token = params.fee_token;
    state.fee = params.fee;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(SetFee) {
    OUTCOME_TRY(state, runtime.getActorState<CcipRouterActorState>());
    OUTCOME_TRY(runtime.validateImmediateCallerIs(state.owner));
    state.fee = params.fee;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(GetFee) {
    OUTCOME_TRY(state, runtime.getActorState<CcipRouterActorState>());
    OUTCOME_TRY(checkMessage(state, params.destination_chain, params.message));
    return state.fee;
  }

  ACTOR_METHOD_IMPL(CcipSend) {
    OUTCOME_TRY(state, runtime.getActorState<CcipRouterActorState>());
    OUTCOME_TRY(checkMessage(state, params.destination_chain, params.message));

    const auto sender = runtime.getImmediateCaller();
    const auto id_preimage = codec::abi::AbiPackedEncoder{}
                                 .uint256(state.chain)
                                 .uint256(state.nonce)
                                 .address(sender)
                                 .address(params.message.receiver)
                                 .bytes();
    OutboundMessage message{crypto::sha::sha256(id_preimage),
                            state.chain,
                            params.destination_chain,
                            sender,
                            params.message.receiver,
                            params.message.data,
                            params.message.extra_args,
                            state.fee};
    ++state.nonce;
    state.outbox.push_back(message);
    OUTCOME_TRY(runtime.commitState(state));
    return message.message_id;
  }
}  // namespace xr::vm::actor::builtin::ccip_router
