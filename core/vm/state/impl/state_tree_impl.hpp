/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <vector>

#include "vm/state/state_tree.hpp"

namespace xr::vm::state {
  /// State tree stores actor state by their address
  class StateTreeImpl : public StateTree {
   public:
    /// State snapshot layer stores changes that are not committed yet.
    struct Tx {
      std::map<Address, Actor> actors;
    };

    StateTreeImpl();

    outcome::result<void> set(const Address &address,
                              const Actor &actor) override;

    outcome::result<boost::optional<Actor>> tryGet(
        const Address &address) const override;

    /// Creates new snapshot layer.
    void txBegin() override;

    /// Reverts snapshot layer to the previous one.
    void txRevert() override;

    /// Removes snapshot layer and merges changes to the previous layer.
    void txEnd() override;

    /// Number of open snapshot layers above the base one
    size_t depth() const;

   private:
    std::vector<Tx> tx_;
  };
}  // namespace xr::vm::state
