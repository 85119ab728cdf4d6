/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/cmp.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace xr::vm::actor {
  using primitives::TokenAmount;
  using primitives::address::Address;

  /// Kind of code deployed at an address
  enum class CodeId : uint8_t {
    kAccount = 0,
    kPrizeManager,
    kTicketManager,
    kErc20Token,
    kErc721Collection,
    kTicketCollection,
    kCcipRouter,
    kVrfCoordinator,
  };

  /// Base of every actor state, states are immutable once committed
  struct ActorState {
    virtual ~ActorState() = default;
  };

  using ActorStatePtr = std::shared_ptr<const ActorState>;

  /**
   * Common actor state interface represents the on-chain storage all actors
   * keep
   */
  struct Actor {
    /// Identifies the code this actor executes
    CodeId code{CodeId::kAccount};
    /// Balance of tokenized value currently held by this actor
    TokenAmount balance{};
    /// State of this actor, empty for accounts
    ActorStatePtr head;
  };

  inline bool operator==(const Actor &lhs, const Actor &rhs) {
    return lhs.code == rhs.code && lhs.balance == rhs.balance
           && lhs.head == rhs.head;
  }
  XR_OPERATOR_NOT_EQUAL(Actor)
}  // namespace xr::vm::actor
