/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/prize_manager/prize_manager_actor.hpp"

#include "codec/ccip/ccip_message.hpp"
#include "common/logger.hpp"

namespace xr::vm::actor::builtin::prize_manager {
  using codec::ccip::PrizeLocked;
  using codec::ccip::RaffleCanceled;
  using codec::ccip::WinnerDrawn;
  using shared::CcipCounterpart;
  using types::Role;
  using types::prize_manager::NftInfo;
  using types::prize_manager::RafflePrize;
  using types::prize_manager::TokenInfo;

  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("prize_manager");
      return logger;
    }

    /// Raffle id must be new and not zero
    outcome::result<void> checkValidRaffle(const PrizeManagerActorState &state,
                                           const RaffleId &raffle_id) {
      if (raffle_id == 0) {
        ABORT(VMExitCode::kIllegalRaffleId);
      }
      if (state.tryGetPrize(raffle_id) != nullptr) {
        ABORT(VMExitCode::kInvalidRaffleId);
      }
      return outcome::success();
    }

    /// Record the prize, lock it and announce it to the ticket manager
    outcome::result<void> lockAndAnnounce(Runtime &runtime,
                                          PrizeManagerActorState &state,
                                          const RaffleId &raffle_id,
                                          RaffleType type,
                                          const CcipCounterpart &destination) {
      state.raffle_prizes[raffle_id] =
          RafflePrize{type, RafflePrizeStatus::kNone, {}, destination};
      state.lockPrize(raffle_id);
      OUTCOME_TRY(runtime.commitState(state));
      OUTCOME_TRY(shared::sendCcipMessage(runtime,
                                          state.ccip,
                                          destination,
                                          codec::ccip::encode(
                                              PrizeLocked{raffle_id})));
      return outcome::success();
    }

    /// Record must exist and must not be canceled
    outcome::result<const RafflePrize *> getActivePrize(
        const PrizeManagerActorState &state, const RaffleId &raffle_id) {
      const auto prize = state.tryGetPrize(raffle_id);
      if (prize == nullptr || prize->status == RafflePrizeStatus::kCanceled) {
        ABORT(VMExitCode::kInvalidRaffle);
      }
      return prize;
    }

    outcome::result<void> onRaffleCanceled(Runtime &runtime,
                                           PrizeManagerActorState &state,
                                           const Any2EvmMessage &message,
                                           const RaffleCanceled &canceled) {
      OUTCOME_TRY(prize, getActivePrize(state, canceled.raffle_id));
      if (prize->ticket_manager
          != CcipCounterpart{message.sender, message.source_chain}) {
        ABORT(VMExitCode::kUnauthorizedCCIPSender);
      }
      if (prize->status != RafflePrizeStatus::kNone) {
        ABORT(VMExitCode::kInvalidRaffle);
      }
      state.unlockPrize(canceled.raffle_id);
      state.raffle_prizes[canceled.raffle_id].status =
          RafflePrizeStatus::kCanceled;
      OUTCOME_TRY(runtime.commitState(state));
      runtime.emitEvent(types::PrizeUnlocked{canceled.raffle_id});
      return outcome::success();
    }

    outcome::result<void> onWinnerDrawn(Runtime &runtime,
                                        PrizeManagerActorState &state,
                                        const Any2EvmMessage &message,
                                        const WinnerDrawn &drawn) {
      OUTCOME_TRY(prize, getActivePrize(state, drawn.raffle_id));
      if (prize->ticket_manager
          != CcipCounterpart{message.sender, message.source_chain}) {
        ABORT(VMExitCode::kUnauthorizedCCIPSender);
      }
      state.raffle_prizes[drawn.raffle_id].winner = drawn.winner;
      OUTCOME_TRY(runtime.commitState(state));
      runtime.emitEvent(
          types::WinnerPropagated{drawn.raffle_id, drawn.winner});
      return outcome::success();
    }
  }  // namespace

  // Construct
  //============================================================================

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(head, runtime.getActorHead());
    if (head) {
      ABORT(VMExitCode::kSysErrForbidden);
    }
    PrizeManagerActorState state;
    state.ccip.link_token = params.link_token;
    state.ccip.router = params.router;
    state.roles.setRole(runtime.getImmediateCaller(), Role::kAdmin, true);
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  // LockNFT
  //============================================================================

  ACTOR_METHOD_IMPL(LockNFT) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));
    OUTCOME_TRY(checkValidRaffle(state, params.raffle_id));

    OUTCOME_TRY(owner, runtime.getNftOwner(params.nft, params.token_id));
    if (owner != runtime.getCurrentReceiver()
        || state.isNftLocked(params.nft, params.token_id)) {
      ABORT(VMExitCode::kInvalidPrize);
    }

    state.nft_raffles[params.raffle_id] = NftInfo{params.nft, params.token_id};
    OUTCOME_TRY(lockAndAnnounce(runtime,
                                state,
                                params.raffle_id,
                                RaffleType::kNft,
                                {params.ticket_manager, params.chain}));
    runtime.emitEvent(types::NFTPrizeLocked{
        params.raffle_id, params.nft, params.token_id});
    return outcome::success();
  }

  // LockETH
  //============================================================================

  ACTOR_METHOD_IMPL(LockETH) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));
    OUTCOME_TRY(checkValidRaffle(state, params.raffle_id));

    OUTCOME_TRY(balance, runtime.getCurrentBalance());
    if (params.amount == 0 || balance < state.eth_locked
        || balance - state.eth_locked < params.amount) {
      ABORT(VMExitCode::kInvalidPrize);
    }

    state.eth_raffles[params.raffle_id] = params.amount;
    OUTCOME_TRY(lockAndAnnounce(runtime,
                                state,
                                params.raffle_id,
                                RaffleType::kEth,
                                {params.ticket_manager, params.chain}));
    runtime.emitEvent(types::ETHPrizeLocked{params.raffle_id, params.amount});
    return outcome::success();
  }

  // LockTokens
  //============================================================================

  ACTOR_METHOD_IMPL(LockTokens) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));
    OUTCOME_TRY(checkValidRaffle(state, params.raffle_id));

    if (params.token == state.ccip.link_token) {
      ABORT(VMExitCode::kLINKTokenNotPermitted);
    }
    OUTCOME_TRY(balance,
                runtime.getTokenBalance(params.token,
                                        runtime.getCurrentReceiver()));
    const auto locked = state.tokensLocked(params.token);
    if (params.amount == 0 || balance < locked
        || balance - locked < params.amount) {
      ABORT(VMExitCode::kInvalidPrize);
    }

    state.token_raffles[params.raffle_id] =
        TokenInfo{params.token, params.amount};
    OUTCOME_TRY(lockAndAnnounce(runtime,
                                state,
                                params.raffle_id,
                                RaffleType::kToken,
                                {params.ticket_manager, params.chain}));
    runtime.emitEvent(types::TokenPrizeLocked{
        params.raffle_id, params.token, params.amount});
    return outcome::success();
  }

  // WithdrawToken
  //============================================================================

  ACTOR_METHOD_IMPL(WithdrawToken) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));

    OUTCOME_TRY(balance,
                runtime.getTokenBalance(params.token,
                                        runtime.getCurrentReceiver()));
    const auto locked = state.tokensLocked(params.token);
    if (balance < locked || balance - locked < params.amount) {
      ABORT(VMExitCode::kInsufficientBalance);
    }
    OUTCOME_TRY(runtime.transferTokens(
        params.token, runtime.getImmediateCaller(), params.amount));
    return outcome::success();
  }

  // WithdrawNFT
  //============================================================================

  ACTOR_METHOD_IMPL(WithdrawNFT) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));

    if (state.isNftLocked(params.nft, params.token_id)) {
      ABORT(VMExitCode::kNFTLocked);
    }
    OUTCOME_TRY(owner, runtime.getNftOwner(params.nft, params.token_id));
    if (owner != runtime.getCurrentReceiver()) {
      ABORT(VMExitCode::kNotAnNFT);
    }
    OUTCOME_TRY(runtime.transferNft(
        params.nft, runtime.getImmediateCaller(), params.token_id));
    return outcome::success();
  }

  // WithdrawETH
  //============================================================================

  ACTOR_METHOD_IMPL(WithdrawETH) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));

    OUTCOME_TRY(balance, runtime.getCurrentBalance());
    if (balance < state.eth_locked
        || balance - state.eth_locked < params.amount) {
      ABORT(VMExitCode::kInsufficientBalance);
    }
    CHANGE_ERROR(
        runtime.sendFunds(runtime.getImmediateCaller(), params.amount),
        VMExitCode::kETHTransferFail);
    return outcome::success();
  }

  // ClaimPrize
  //============================================================================

  outcome::result<void> ClaimPrize::sendPrize(
      Runtime &runtime,
      const PrizeManagerActorState &state,
      const RaffleId &raffle_id,
      const Address &winner) {
    switch (state.raffle_prizes.at(raffle_id).type) {
      case RaffleType::kNft: {
        const auto &nft = state.nft_raffles.at(raffle_id);
        OUTCOME_TRY(runtime.transferNft(nft.contract, winner, nft.token_id));
        break;
      }
      case RaffleType::kEth:
        CHANGE_ERROR(runtime.sendFunds(winner, state.eth_raffles.at(raffle_id)),
                     VMExitCode::kETHTransferFail);
        break;
      case RaffleType::kToken: {
        const auto &token = state.token_raffles.at(raffle_id);
        OUTCOME_TRY(runtime.transferTokens(
            token.token_contract, winner, token.amount));
        break;
      }
      case RaffleType::kNone:
        ABORT(VMExitCode::kInvalidRaffle);
    }
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(ClaimPrize) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    OUTCOME_TRY(prize, getActivePrize(state, params.raffle_id));

    const auto caller = runtime.getImmediateCaller();
    if (caller != prize->winner) {
      ABORT(VMExitCode::kUnauthorizedToClaim);
    }
    if (prize->status == RafflePrizeStatus::kClaimed) {
      ABORT(VMExitCode::kAlreadyClaimed);
    }

    // state is committed before the prize leaves, a reentrant claim sees it
    state.unlockPrize(params.raffle_id);
    state.raffle_prizes[params.raffle_id].status = RafflePrizeStatus::kClaimed;
    OUTCOME_TRY(runtime.commitState(state));

    OUTCOME_TRY(sendPrize(runtime, state, params.raffle_id, caller));
    runtime.emitEvent(types::PrizeClaimed{params.raffle_id, caller});
    return outcome::success();
  }

  // CcipReceive
  //============================================================================

  ACTOR_METHOD_IMPL(CcipReceive) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    const auto &message = params.message;
    OUTCOME_TRY(shared::validateCcipReceive(runtime, state.ccip, message));

    auto decoded = codec::ccip::decodePrizeChainMessage(message.data);
    if (!decoded) {
      logger()->error("message {} from {} rejected: {}",
                      message.message_id.toHex(),
                      message.sender.toString(),
                      decoded.error().message());
      return decoded.error();
    }

    if (const auto canceled = std::get_if<RaffleCanceled>(&decoded.value())) {
      OUTCOME_TRY(onRaffleCanceled(runtime, state, message, *canceled));
    } else {
      OUTCOME_TRY(onWinnerDrawn(
          runtime, state, message, std::get<WinnerDrawn>(decoded.value())));
    }
    return outcome::success();
  }

  // Views
  //============================================================================

  ACTOR_METHOD_IMPL(GetRaffle) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    const auto prize = state.tryGetPrize(params.raffle_id);
    if (prize == nullptr) {
      return Result{RaffleType::kNone, RafflePrizeStatus::kNone, {}};
    }
    return Result{prize->type, prize->status, prize->winner};
  }

  ACTOR_METHOD_IMPL(GetNFTRaffle) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    const auto it = state.nft_raffles.find(params.raffle_id);
    if (it == state.nft_raffles.end()) {
      return Result{};
    }
    return it->second;
  }

  ACTOR_METHOD_IMPL(GetETHRaffle) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    const auto it = state.eth_raffles.find(params.raffle_id);
    if (it == state.eth_raffles.end()) {
      return Result{0};
    }
    return it->second;
  }

  ACTOR_METHOD_IMPL(GetTokenRaffle) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    const auto it = state.token_raffles.find(params.raffle_id);
    if (it == state.token_raffles.end()) {
      return Result{};
    }
    return it->second;
  }

  ACTOR_METHOD_IMPL(GetWinner) {
    OUTCOME_TRY(state, runtime.getActorState<PrizeManagerActorState>());
    OUTCOME_TRY(prize, getActivePrize(state, params.raffle_id));
    if (prize->winner.isZero()) {
      ABORT(VMExitCode::kRaffleNotFulfilled);
    }
    return prize->winner;
  }
}  // namespace xr::vm::actor::builtin::prize_manager
