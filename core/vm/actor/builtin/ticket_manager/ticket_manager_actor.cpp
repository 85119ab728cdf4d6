/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/ticket_manager/ticket_manager_actor.hpp"

#include <limits>

#include "codec/abi/abi_packed.hpp"
#include "codec/ccip/ccip_message.hpp"
#include "common/logger.hpp"
#include "vm/actor/builtin/types/ticket_manager/policy.hpp"

namespace xr::vm::actor::builtin::ticket_manager {
  using codec::abi::AbiPackedEncoder;
  using codec::ccip::RaffleCanceled;
  using codec::ccip::WinnerDrawn;
  using types::Role;
  using types::ticket_manager::kMinRaffleDuration;
  using types::ticket_manager::Raffle;

  namespace {
    common::Logger logger() {
      static common::Logger logger = common::createLogger("ticket_manager");
      return logger;
    }

    /**
     * Checks that the raffle can be drawn
     * @return issued ticket supply
     */
    outcome::result<TicketSupply> checkShouldDraw(
        const Runtime &runtime,
        const TicketManagerActorState &state,
        const RaffleId &raffle_id) {
      const auto it = state.raffles.find(raffle_id);
      if (it == state.raffles.end() || it->second.status != RaffleStatus::kIdle) {
        ABORT(VMExitCode::kInvalidRaffle);
      }
      const auto &raffle = it->second;
      OUTCOME_TRY(supply, runtime.getTicketSupply(state.tickets, raffle_id));
      if (supply == 0) {
        ABORT(VMExitCode::kNoParticipants);
      }
      if (runtime.getBlockTimestamp() < raffle.ends_at) {
        if (supply < raffle.max_ticket_supply) {
          ABORT(VMExitCode::kRaffleIsStillOpen);
        }
      }
      if (supply < raffle.min_tickets_threshold) {
        ABORT(VMExitCode::kTargetTicketsNotReached);
      }
      return supply;
    }

    /// Checks that the raffle can be canceled
    outcome::result<void> checkShouldCancel(
        const Runtime &runtime,
        const TicketManagerActorState &state,
        const RaffleId &raffle_id) {
      const auto it = state.raffles.find(raffle_id);
      if (it == state.raffles.end()) {
        ABORT(VMExitCode::kInvalidRaffle);
      }
      const auto &raffle = it->second;
      if (raffle.status == RaffleStatus::kPrizeLocked) {
        return outcome::success();
      }
      if (raffle.status != RaffleStatus::kIdle) {
        ABORT(VMExitCode::kInvalidRaffle);
      }
      if (raffle.ends_at >= runtime.getBlockTimestamp()) {
        ABORT(VMExitCode::kRaffleIsStillOpen);
      }
      OUTCOME_TRY(supply, runtime.getTicketSupply(state.tickets, raffle_id));
      if (supply > raffle.min_tickets_threshold) {
        ABORT(VMExitCode::kTargetTicketsReached);
      }
      return outcome::success();
    }

    /// Owner of the ticket picked by the random word
    outcome::result<Address> computeWinner(
        const Runtime &runtime,
        const TicketManagerActorState &state,
        const RaffleId &raffle_id,
        const Raffle &raffle) {
      const auto request = state.requests.find(raffle.request_id);
      if (request == state.requests.end() || !request->second.random_word) {
        ABORT(VMExitCode::kRequestNotFound);
      }
      OUTCOME_TRY(supply, runtime.getTicketSupply(state.tickets, raffle_id));
      if (supply == 0) {
        ABORT(VMExitCode::kNoParticipants);
      }
      const auto ticket = *request->second.random_word % UInt256{supply};
      return runtime.getTicketOwner(
          state.tickets, raffle_id, ticket.convert_to<TicketSupply>());
    }

    /// Raffle that must exist in the given status
    outcome::result<Raffle *> getRaffleIn(TicketManagerActorState &state,
                                          const RaffleId &raffle_id,
                                          RaffleStatus status,
                                          VMExitCode error) {
      const auto it = state.raffles.find(raffle_id);
      if (it == state.raffles.end() || it->second.status != status) {
        ABORT(error);
      }
      return &it->second;
    }
  }  // namespace

  Bytes couponMessage(const Address &buyer,
                      const UInt256 &nonce,
                      const RaffleId &raffle_id,
                      TicketCount count,
                      const UInt256 &block_number,
                      const TokenAmount &value) {
    return AbiPackedEncoder{}
        .address(buyer)
        .uint256(nonce)
        .uint256(raffle_id)
        .uint16(count)
        .uint256(block_number)
        .uint256(value)
        .bytes();
  }

  // Construct
  //============================================================================

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(head, runtime.getActorHead());
    if (head) {
      ABORT(VMExitCode::kSysErrForbidden);
    }
    TicketManagerActorState state;
    state.ccip.link_token = params.link_token;
    state.ccip.router = params.router;
    state.tickets = params.tickets;
    state.vrf_coordinator = params.vrf_coordinator;
    state.roles.setRole(runtime.getImmediateCaller(), Role::kAdmin, true);
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  // CcipReceive
  //============================================================================

  ACTOR_METHOD_IMPL(CcipReceive) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    const auto &message = params.message;
    OUTCOME_TRY(shared::validateCcipReceive(runtime, state.ccip, message));

    auto decoded = codec::ccip::decodePrizeLocked(message.data);
    if (!decoded) {
      logger()->error("message {} from {} rejected: {}",
                      message.message_id.toHex(),
                      message.sender.toString(),
                      decoded.error().message());
      return decoded.error();
    }
    const auto &raffle_id = decoded.value().raffle_id;

    auto &raffle = state.raffles[raffle_id];
    if (raffle.status != RaffleStatus::kNone) {
      // redelivery, the prize is already known
      logger()->warn("duplicate prize locked message {} for raffle {}",
                     message.message_id.toHex(),
                     raffle_id.str());
      return outcome::success();
    }
    raffle.status = RaffleStatus::kPrizeLocked;
    raffle.prize_manager = {message.sender, message.source_chain};
    OUTCOME_TRY(runtime.commitState(state));
    runtime.emitEvent(types::RafflePrizeLocked{
        message.message_id, message.source_chain, raffle_id});
    return outcome::success();
  }

  // CreateRaffle
  //============================================================================

  outcome::result<void> CreateRaffle::checkRaffleTimings(
      const Runtime &runtime, Timestamp starts_at, Timestamp ends_at) {
    if (starts_at == 0) {
      ABORT(VMExitCode::kRaffleNeedsStartTime);
    }
    if (ends_at < starts_at + kMinRaffleDuration
        || ends_at < runtime.getBlockTimestamp() + kMinRaffleDuration) {
      ABORT(VMExitCode::kRaffleClosingTooSoon);
    }
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(CreateRaffle) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));
    OUTCOME_TRY(raffle,
                getRaffleIn(state,
                            params.raffle_id,
                            RaffleStatus::kPrizeLocked,
                            VMExitCode::kPrizeNotLocked));
    OUTCOME_TRY(checkRaffleTimings(runtime, params.starts_at, params.ends_at));

    raffle->status = RaffleStatus::kIdle;
    raffle->starts_at = params.starts_at;
    raffle->ends_at = params.ends_at;
    raffle->min_tickets_threshold = params.min_tickets;
    raffle->max_ticket_supply = params.max_tickets;
    raffle->max_holdings = params.max_holdings;
    OUTCOME_TRY(runtime.commitState(state));
    runtime.emitEvent(types::NewRaffle{params.raffle_id});
    return outcome::success();
  }

  // BuyTickets
  //============================================================================

  outcome::result<void> BuyTickets::checkTicketPurchaseable(
      const Runtime &runtime,
      const TicketManagerActorState &state,
      const RaffleId &raffle_id,
      TicketCount count) {
    if (count == 0) {
      ABORT(VMExitCode::kInvalidTicketCount);
    }
    const auto it = state.raffles.find(raffle_id);
    if (it == state.raffles.end() || it->second.status != RaffleStatus::kIdle) {
      ABORT(VMExitCode::kInvalidRaffle);
    }
    const auto &raffle = it->second;
    const auto now = runtime.getBlockTimestamp();
    if (now < raffle.starts_at) {
      ABORT(VMExitCode::kRaffleHasNotStarted);
    }
    if (raffle.ends_at != 0 && now > raffle.ends_at) {
      ABORT(VMExitCode::kRaffleHasEnded);
    }
    if (raffle.max_holdings != 0) {
      const auto participation =
          state.getParticipation(raffle_id, runtime.getImmediateCaller());
      if (uint64_t{participation.total_purchased} + count
          > raffle.max_holdings) {
        ABORT(VMExitCode::kTooManyTickets);
      }
    }
    if (raffle.max_ticket_supply != 0) {
      OUTCOME_TRY(supply, runtime.getTicketSupply(state.tickets, raffle_id));
      if (supply + count > raffle.max_ticket_supply) {
        ABORT(VMExitCode::kTooManyTickets);
      }
    }
    return outcome::success();
  }

  outcome::result<void> BuyTickets::checkPurchaseSignature(
      Runtime &runtime,
      const TicketManagerActorState &state,
      const Params &params) {
    if (params.block_number < runtime.getBlockNumber()) {
      ABORT(VMExitCode::kExpiredCoupon);
    }
    const auto buyer = runtime.getImmediateCaller();
    const auto message = couponMessage(buyer,
                                       state.getNonce(buyer),
                                       params.raffle_id,
                                       params.count,
                                       params.block_number,
                                       runtime.getValueReceived());
    CHANGE_ERROR_A(signer,
                   runtime.recoverSigner(message, params.signature),
                   VMExitCode::kUnauthorized);
    if (!state.roles.hasRole(signer, Role::kApi)) {
      ABORT(VMExitCode::kUnauthorized);
    }
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(BuyTickets) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    OUTCOME_TRY(checkTicketPurchaseable(
        runtime, state, params.raffle_id, params.count));
    OUTCOME_TRY(checkPurchaseSignature(runtime, state, params));

    const auto buyer = runtime.getImmediateCaller();
    const auto value = runtime.getValueReceived();
    auto &raffle = state.raffles.at(params.raffle_id);
    auto &participation = raffle.participations[buyer];
    if (value > std::numeric_limits<uint64_t>::max() - participation.total_spent
        || uint64_t{participation.total_purchased} + params.count
               > std::numeric_limits<uint32_t>::max()) {
      ABORT(VMExitCode::kParticipationOverflow);
    }
    participation.total_spent += value.convert_to<uint64_t>();
    participation.total_purchased += params.count;
    raffle.total_raised += value;
    state.nonces[buyer] = state.getNonce(buyer) + 1;
    state.locked_eth += value;
    OUTCOME_TRY(runtime.commitState(state));

    OUTCOME_TRY(runtime.mintTickets(
        state.tickets, buyer, params.raffle_id, params.count));
    return outcome::success();
  }

  // DrawWinner
  //============================================================================

  ACTOR_METHOD_IMPL(DrawWinner) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    OUTCOME_TRY(checkShouldDraw(runtime, state, params.raffle_id));

    OUTCOME_TRY(request_id, runtime.requestRandomWords(state.vrf_coordinator));
    state.requests[request_id] = {params.raffle_id, boost::none};
    auto &raffle = state.raffles.at(params.raffle_id);
    raffle.status = RaffleStatus::kRequested;
    raffle.request_id = request_id;
    OUTCOME_TRY(runtime.commitState(state));
    runtime.emitEvent(types::RequestSent{request_id, params.raffle_id});
    return outcome::success();
  }

  // FulfillRandomWords
  //============================================================================

  ACTOR_METHOD_IMPL(FulfillRandomWords) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    if (runtime.getImmediateCaller() != state.vrf_coordinator) {
      ABORT(VMExitCode::kOnlyCoordinatorCanFulfill);
    }
    if (params.random_words.empty()) {
      ABORT(VMExitCode::kSysErrIllegalArgument);
    }
    const auto it = state.requests.find(params.request_id);
    if (it == state.requests.end() || it->second.random_word) {
      ABORT(VMExitCode::kRequestNotFound);
    }
    auto &request = it->second;
    OUTCOME_TRY(raffle,
                getRaffleIn(state,
                            request.raffle_id,
                            RaffleStatus::kRequested,
                            VMExitCode::kInvalidRaffle));

    request.random_word = params.random_words.front();
    raffle->status = RaffleStatus::kFulfilled;
    OUTCOME_TRY(runtime.commitState(state));
    runtime.emitEvent(types::WinnerDrawn{params.request_id});
    return outcome::success();
  }

  // PropagateRaffleWinner
  //============================================================================

  ACTOR_METHOD_IMPL(PropagateRaffleWinner) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    OUTCOME_TRY(raffle,
                getRaffleIn(state,
                            params.raffle_id,
                            RaffleStatus::kFulfilled,
                            VMExitCode::kInvalidRaffleStatus));
    OUTCOME_TRY(winner,
                computeWinner(runtime, state, params.raffle_id, *raffle));

    raffle->status = RaffleStatus::kPropagated;
    // ticket sales of a drawn raffle are revenue now
    state.locked_eth -= raffle->total_raised;
    OUTCOME_TRY(runtime.commitState(state));

    OUTCOME_TRY(shared::sendCcipMessage(
        runtime,
        state.ccip,
        raffle->prize_manager,
        codec::ccip::encode(WinnerDrawn{params.raffle_id, winner})));
    runtime.emitEvent(types::WinnerPropagated{params.raffle_id, winner});
    return outcome::success();
  }

  // CancelRaffle
  //============================================================================

  ACTOR_METHOD_IMPL(CancelRaffle) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));
    OUTCOME_TRY(checkShouldCancel(runtime, state, params.raffle_id));

    auto &raffle = state.raffles.at(params.raffle_id);
    raffle.status = RaffleStatus::kCanceled;
    OUTCOME_TRY(runtime.commitState(state));

    OUTCOME_TRY(shared::sendCcipMessage(
        runtime,
        state.ccip,
        raffle.prize_manager,
        codec::ccip::encode(RaffleCanceled{params.raffle_id})));
    runtime.emitEvent(types::RaffleCanceled{params.raffle_id});
    return outcome::success();
  }

  // RefundPlayers
  //============================================================================

  ACTOR_METHOD_IMPL(RefundPlayers) {
    for (const auto &player : params.players) {
      // state is read again for each player, a recipient may have re-entered
      OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
      OUTCOME_TRY(raffle,
                  getRaffleIn(state,
                              params.raffle_id,
                              RaffleStatus::kCanceled,
                              VMExitCode::kInvalidRaffle));
      auto &participation = raffle->participations[player];
      if (participation.withdrawn) {
        ABORT(VMExitCode::kPlayerAlreadyRefunded);
      }
      if (participation.total_spent == 0) {
        ABORT(VMExitCode::kNothingToSend);
      }
      const TokenAmount amount{participation.total_spent};
      participation.withdrawn = true;
      state.locked_eth -= amount;
      OUTCOME_TRY(runtime.commitState(state));

      CHANGE_ERROR(runtime.sendFunds(player, amount),
                   VMExitCode::kETHTransferFail);
      runtime.emitEvent(types::PlayerRefund{params.raffle_id, player, amount});
    }
    return outcome::success();
  }

  // WithdrawETH
  //============================================================================

  ACTOR_METHOD_IMPL(WithdrawETH) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));

    OUTCOME_TRY(balance, runtime.getCurrentBalance());
    if (balance < state.locked_eth
        || balance - state.locked_eth < params.amount) {
      ABORT(VMExitCode::kInsufficientBalance);
    }
    CHANGE_ERROR(
        runtime.sendFunds(runtime.getImmediateCaller(), params.amount),
        VMExitCode::kETHTransferFail);
    return outcome::success();
  }

  // WithdrawTokens
  //============================================================================

  ACTOR_METHOD_IMPL(WithdrawTokens) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    OUTCOME_TRY(shared::requireRole(runtime, state.roles, Role::kAdmin));

    OUTCOME_TRY(balance,
                runtime.getTokenBalance(params.token,
                                        runtime.getCurrentReceiver()));
    if (balance < params.amount) {
      ABORT(VMExitCode::kInsufficientBalance);
    }
    OUTCOME_TRY(runtime.transferTokens(
        params.token, runtime.getImmediateCaller(), params.amount));
    return outcome::success();
  }

  // Views
  //============================================================================

  ACTOR_METHOD_IMPL(GetWinner) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    const auto raffle = state.getRaffle(params.raffle_id);
    if (raffle.status < RaffleStatus::kFulfilled
        || raffle.status == RaffleStatus::kCanceled) {
      ABORT(VMExitCode::kRaffleNotFulfilled);
    }
    return computeWinner(runtime, state, params.raffle_id, raffle);
  }

  ACTOR_METHOD_IMPL(GetRaffle) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    const auto raffle = state.getRaffle(params.raffle_id);
    return Result{raffle.status,
                  raffle.starts_at,
                  raffle.ends_at,
                  raffle.min_tickets_threshold,
                  raffle.max_ticket_supply,
                  raffle.max_holdings,
                  raffle.total_raised,
                  raffle.request_id};
  }

  ACTOR_METHOD_IMPL(GetParticipation) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    return state.getParticipation(params.raffle_id, params.player);
  }

  ACTOR_METHOD_IMPL(GetNonce) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    return state.getNonce(params.buyer);
  }

  ACTOR_METHOD_IMPL(ShouldDrawRaffle) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    OUTCOME_TRY(checkShouldDraw(runtime, state, params.raffle_id));
    return true;
  }

  ACTOR_METHOD_IMPL(ShouldCancelRaffle) {
    OUTCOME_TRY(state, runtime.getActorState<TicketManagerActorState>());
    OUTCOME_TRY(checkShouldCancel(runtime, state, params.raffle_id));
    return true;
  }
}  // namespace xr::vm::actor::builtin::ticket_manager
