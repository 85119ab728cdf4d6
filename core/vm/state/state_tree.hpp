/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "vm/actor/actor.hpp"
#include "vm/state/state_tree_error.hpp"

namespace xr::vm::state {
  using actor::Actor;
  using primitives::address::Address;

  /// State tree
  class StateTree {
   public:
    virtual ~StateTree() = default;

    /// Set actor state
    virtual outcome::result<void> set(const Address &address,
                                      const Actor &actor) = 0;

    /// Get actor state
    virtual outcome::result<boost::optional<Actor>> tryGet(
        const Address &address) const = 0;

    outcome::result<Actor> get(const Address &address) const {
      OUTCOME_TRY(actor, tryGet(address));
      if (actor) {
        return *actor;
      }
      return StateTreeError::kStateNotFound;
    }

    virtual void txBegin() = 0;
    virtual void txRevert() = 0;
    virtual void txEnd() = 0;
  };
}  // namespace xr::vm::state
