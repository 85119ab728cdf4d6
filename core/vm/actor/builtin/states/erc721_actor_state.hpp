/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "vm/actor/actor.hpp"

namespace xr::vm::actor::builtin::states {
  using primitives::TokenId;
  using primitives::address::Address;

  /// NFT collection
  struct Erc721ActorState : ActorState {
    /// Zero address if never minted
    Address ownerOf(const TokenId &token_id) const {
      const auto it = owners.find(token_id);
      return it == owners.end() ? Address{} : it->second;
    }

    /// Allowed to mint
    Address owner;
    std::map<TokenId, Address> owners;
  };
}  // namespace xr::vm::actor::builtin::states
