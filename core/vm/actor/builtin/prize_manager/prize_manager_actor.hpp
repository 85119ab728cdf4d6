/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/shared/ccip.hpp"
#include "vm/actor/builtin/shared/roles.hpp"
#include "vm/actor/builtin/states/prize_manager_actor_state.hpp"

/**
 * Prize manager keeps custody of prizes on the prize chain. A locked prize
 * is announced to the ticket manager, which later answers with a cancel or
 * with the winner of the raffle.
 */
namespace xr::vm::actor::builtin::prize_manager {
  using primitives::ChainSelector;
  using primitives::RaffleId;
  using primitives::TokenAmount;
  using primitives::TokenId;
  using primitives::address::Address;
  using runtime::Any2EvmMessage;
  using states::PrizeManagerActorState;
  using types::RafflePrizeStatus;
  using types::RaffleType;

  struct Construct : ActorMethodBase<1> {
    struct Params {
      Address link_token;
      Address router;
    };
    ACTOR_METHOD_DECL();
  };

  using SetRole = shared::SetRole<PrizeManagerActorState, 2>;
  using HasRole = shared::HasRole<PrizeManagerActorState, 3>;
  using SetCCIPCounterpart =
      shared::SetCCIPCounterpart<PrizeManagerActorState, 4>;
  using SetCCIPExtraArgs = shared::SetCCIPExtraArgs<PrizeManagerActorState, 5>;

  struct LockNFT : ActorMethodBase<6> {
    struct Params {
      Address ticket_manager;
      ChainSelector chain;
      RaffleId raffle_id;
      Address nft;
      TokenId token_id;
    };
    ACTOR_METHOD_DECL();
  };

  /// Payable, the value received counts towards the prize
  struct LockETH : ActorMethodBase<7> {
    struct Params {
      Address ticket_manager;
      ChainSelector chain;
      RaffleId raffle_id;
      TokenAmount amount;
    };
    ACTOR_METHOD_DECL();
  };

  struct LockTokens : ActorMethodBase<8> {
    struct Params {
      Address ticket_manager;
      ChainSelector chain;
      RaffleId raffle_id;
      Address token;
      TokenAmount amount;
    };
    ACTOR_METHOD_DECL();
  };

  /// Withdraw tokens that are not locked as prizes
  struct WithdrawToken : ActorMethodBase<9> {
    struct Params {
      Address token;
      TokenAmount amount;
    };
    ACTOR_METHOD_DECL();
  };

  struct WithdrawNFT : ActorMethodBase<10> {
    struct Params {
      Address nft;
      TokenId token_id;
    };
    ACTOR_METHOD_DECL();
  };

  struct WithdrawETH : ActorMethodBase<11> {
    struct Params {
      TokenAmount amount;
    };
    ACTOR_METHOD_DECL();
  };

  struct ClaimPrize : ActorMethodBase<12> {
    struct Params {
      RaffleId raffle_id;
    };
    ACTOR_METHOD_DECL();

    static outcome::result<void> sendPrize(Runtime &runtime,
                                           const PrizeManagerActorState &state,
                                           const RaffleId &raffle_id,
                                           const Address &winner);
  };

  /// Handles messages from the ticket manager, callable by the router only
  struct CcipReceive : ActorMethodBase<13> {
    struct Params {
      Any2EvmMessage message;
    };
    ACTOR_METHOD_DECL();
  };

  struct GetRaffle : ActorMethodBase<14> {
    struct Params {
      RaffleId raffle_id;
    };
    struct Result {
      RaffleType type;
      RafflePrizeStatus status;
      Address winner;
    };
    ACTOR_METHOD_DECL();
  };

  struct GetNFTRaffle : ActorMethodBase<15> {
    struct Params {
      RaffleId raffle_id;
    };
    using Result = types::prize_manager::NftInfo;
    ACTOR_METHOD_DECL();
  };

  struct GetETHRaffle : ActorMethodBase<16> {
    struct Params {
      RaffleId raffle_id;
    };
    using Result = TokenAmount;
    ACTOR_METHOD_DECL();
  };

  struct GetTokenRaffle : ActorMethodBase<17> {
    struct Params {
      RaffleId raffle_id;
    };
    using Result = types::prize_manager::TokenInfo;
    ACTOR_METHOD_DECL();
  };

  /**
   * Winner of the raffle
   * @return kInvalidRaffle for unknown or canceled raffle,
   * kRaffleNotFulfilled while the winner is not propagated yet
   */
  struct GetWinner : ActorMethodBase<18> {
    struct Params {
      RaffleId raffle_id;
    };
    using Result = Address;
    ACTOR_METHOD_DECL();
  };
}  // namespace xr::vm::actor::builtin::prize_manager
