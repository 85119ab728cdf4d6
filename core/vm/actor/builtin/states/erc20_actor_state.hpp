/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "vm/actor/actor.hpp"

namespace xr::vm::actor::builtin::states {
  using primitives::TokenAmount;
  using primitives::address::Address;

  /// Fungible token ledger
  struct Erc20ActorState : ActorState {
    TokenAmount balanceOf(const Address &owner) const {
      const auto it = balances.find(owner);
      return it == balances.end() ? TokenAmount{0} : it->second;
    }

    /// Allowed to mint
    Address owner;
    std::map<Address, TokenAmount> balances;
  };
}  // namespace xr::vm::actor::builtin::states
