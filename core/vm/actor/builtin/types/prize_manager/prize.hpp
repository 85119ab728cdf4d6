/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/builtin/shared/ccip.hpp"
#include "vm/actor/builtin/types/raffle.hpp"

namespace xr::vm::actor::builtin::types::prize_manager {
  using primitives::TokenAmount;
  using primitives::TokenId;
  using primitives::address::Address;
  using shared::CcipCounterpart;

  /// Prize record of a raffle
  struct RafflePrize {
    RaffleType type{RaffleType::kNone};
    RafflePrizeStatus status{RafflePrizeStatus::kNone};
    /// Zero until the winner is propagated
    Address winner;
    /// Ticket manager the prize was announced to
    CcipCounterpart ticket_manager;
  };

  struct NftInfo {
    Address contract;
    TokenId token_id;
  };

  struct TokenInfo {
    Address token_contract;
    TokenAmount amount;
  };
}  // namespace xr::vm::actor::builtin::types::prize_manager
