/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/shared/ccip.hpp"
#include "vm/actor/builtin/shared/roles.hpp"
#include "vm/actor/builtin/states/ticket_manager_actor_state.hpp"

/**
 * Ticket manager runs raffles on the ticket chain: it opens a raffle once
 * the prize is locked on the prize chain, sells tickets, draws the winner
 * with a random word and reports the outcome back to the prize manager.
 */
namespace xr::vm::actor::builtin::ticket_manager {
  using primitives::RaffleId;
  using primitives::RequestId;
  using primitives::TicketCount;
  using primitives::TicketSupply;
  using primitives::Timestamp;
  using primitives::TokenAmount;
  using primitives::UInt256;
  using primitives::address::Address;
  using runtime::Any2EvmMessage;
  using states::TicketManagerActorState;
  using types::RaffleStatus;
  using types::ticket_manager::Participation;

  struct Construct : ActorMethodBase<1> {
    struct Params {
      Address link_token;
      Address router;
      Address tickets;
      Address vrf_coordinator;
    };
    ACTOR_METHOD_DECL();
  };

  using SetRole = shared::SetRole<TicketManagerActorState, 2>;
  using HasRole = shared::HasRole<TicketManagerActorState, 3>;
  using SetCCIPCounterpart =
      shared::SetCCIPCounterpart<TicketManagerActorState, 4>;
  using SetCCIPExtraArgs =
      shared::SetCCIPExtraArgs<TicketManagerActorState, 5>;

  /// Handles "prize locked" messages, callable by the router only
  struct CcipReceive : ActorMethodBase<6> {
    struct Params {
      Any2EvmMessage message;
    };
    ACTOR_METHOD_DECL();
  };

  struct CreateRaffle : ActorMethodBase<7> {
    struct Params {
      RaffleId raffle_id;
      Timestamp starts_at;
      Timestamp ends_at;
      uint32_t min_tickets;
      uint32_t max_tickets;
      uint32_t max_holdings;
    };
    ACTOR_METHOD_DECL();

    static outcome::result<void> checkRaffleTimings(const Runtime &runtime,
                                                    Timestamp starts_at,
                                                    Timestamp ends_at);
  };

  /**
   * Payable, the value must match the price signed by an API signer in the
   * coupon
   */
  struct BuyTickets : ActorMethodBase<8> {
    struct Params {
      RaffleId raffle_id;
      TicketCount count;
      /// Last block the coupon is valid for
      UInt256 block_number;
      Bytes signature;
    };
    ACTOR_METHOD_DECL();

    static outcome::result<void> checkTicketPurchaseable(
        const Runtime &runtime,
        const TicketManagerActorState &state,
        const RaffleId &raffle_id,
        TicketCount count);

    static outcome::result<void> checkPurchaseSignature(
        Runtime &runtime,
        const TicketManagerActorState &state,
        const Params &params);
  };

  /**
   * Bytes signed by the API signer to authorize a purchase,
   * abi.encodePacked(buyer, nonce, raffle_id, count, block_number, value)
   */
  Bytes couponMessage(const Address &buyer,
                      const UInt256 &nonce,
                      const RaffleId &raffle_id,
                      TicketCount count,
                      const UInt256 &block_number,
                      const TokenAmount &value);

  struct DrawWinner : ActorMethodBase<9> {
    struct Params {
      RaffleId raffle_id;
    };
    ACTOR_METHOD_DECL();
  };

  /// Callable by the coordinator only, once per request
  struct FulfillRandomWords : ActorMethodBase<10> {
    struct Params {
      RequestId request_id;
      std::vector<UInt256> random_words;
    };
    ACTOR_METHOD_DECL();
  };

  struct PropagateRaffleWinner : ActorMethodBase<11> {
    struct Params {
      RaffleId raffle_id;
    };
    ACTOR_METHOD_DECL();
  };

  struct CancelRaffle : ActorMethodBase<12> {
    struct Params {
      RaffleId raffle_id;
    };
    ACTOR_METHOD_DECL();
  };

  /// Refund canceled raffle, all or nothing
  struct RefundPlayers : ActorMethodBase<13> {
    struct Params {
      RaffleId raffle_id;
      std::vector<Address> players;
    };
    ACTOR_METHOD_DECL();
  };

  /// Withdraw revenue, value paid for open raffles stays locked
  struct WithdrawETH : ActorMethodBase<14> {
    struct Params {
      TokenAmount amount;
    };
    ACTOR_METHOD_DECL();
  };

  struct WithdrawTokens : ActorMethodBase<15> {
    struct Params {
      Address token;
      TokenAmount amount;
    };
    ACTOR_METHOD_DECL();
  };

  struct GetWinner : ActorMethodBase<16> {
    struct Params {
      RaffleId raffle_id;
    };
    using Result = Address;
    ACTOR_METHOD_DECL();
  };

  struct GetRaffle : ActorMethodBase<17> {
    struct Params {
      RaffleId raffle_id;
    };
    struct Result {
      RaffleStatus status;
      Timestamp starts_at;
      Timestamp ends_at;
      uint32_t min_tickets_threshold;
      uint32_t max_ticket_supply;
      uint32_t max_holdings;
      TokenAmount total_raised;
      RequestId request_id;
    };
    ACTOR_METHOD_DECL();
  };

  struct GetParticipation : ActorMethodBase<18> {
    struct Params {
      RaffleId raffle_id;
      Address player;
    };
    using Result = Participation;
    ACTOR_METHOD_DECL();
  };

  struct GetNonce : ActorMethodBase<19> {
    struct Params {
      Address buyer;
    };
    using Result = UInt256;
    ACTOR_METHOD_DECL();
  };

  /// Succeeds if DrawWinner would, fails with its error otherwise
  struct ShouldDrawRaffle : ActorMethodBase<20> {
    struct Params {
      RaffleId raffle_id;
    };
    using Result = bool;
    ACTOR_METHOD_DECL();
  };

  /// Succeeds if CancelRaffle would, fails with its error otherwise
  struct ShouldCancelRaffle : ActorMethodBase<21> {
    struct Params {
      RaffleId raffle_id;
    };
    using Result = bool;
    ACTOR_METHOD_DECL();
  };
}  // namespace xr::vm::actor::builtin::ticket_manager
