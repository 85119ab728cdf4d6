/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "common/blob.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"
#include "vm/actor/builtin/types/raffle.hpp"

namespace xr::vm::actor::builtin::types {
  using common::Hash256;
  using primitives::ChainSelector;
  using primitives::RaffleId;
  using primitives::RequestId;
  using primitives::TokenAmount;
  using primitives::TokenId;
  using primitives::address::Address;

  struct RoleUpdated {
    Address user;
    Role role;
    bool status;
  };

  struct NFTPrizeLocked {
    RaffleId raffle_id;
    Address nft;
    TokenId token_id;
  };

  struct ETHPrizeLocked {
    RaffleId raffle_id;
    TokenAmount amount;
  };

  struct TokenPrizeLocked {
    RaffleId raffle_id;
    Address token;
    TokenAmount amount;
  };

  struct PrizeUnlocked {
    RaffleId raffle_id;
  };

  struct WinnerPropagated {
    RaffleId raffle_id;
    Address winner;
  };

  struct PrizeClaimed {
    RaffleId raffle_id;
    Address winner;
  };

  struct RafflePrizeLocked {
    Hash256 message_id;
    ChainSelector source_chain;
    RaffleId raffle_id;
  };

  struct NewRaffle {
    RaffleId raffle_id;
  };

  struct RequestSent {
    RequestId request_id;
    RaffleId raffle_id;
  };

  struct WinnerDrawn {
    RequestId request_id;
  };

  struct PlayerRefund {
    RaffleId raffle_id;
    Address player;
    TokenAmount amount;
  };

  struct RaffleCanceled {
    RaffleId raffle_id;
  };

  /// Event emitted by an actor, appended to the chain log
  using Event = std::variant<RoleUpdated,
                             NFTPrizeLocked,
                             ETHPrizeLocked,
                             TokenPrizeLocked,
                             PrizeUnlocked,
                             WinnerPropagated,
                             PrizeClaimed,
                             RafflePrizeLocked,
                             NewRaffle,
                             RequestSent,
                             WinnerDrawn,
                             PlayerRefund,
                             RaffleCanceled>;
}  // namespace xr::vm::actor::builtin::types
