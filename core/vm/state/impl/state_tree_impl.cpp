/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/state/impl/state_tree_impl.hpp"

namespace xr::vm::state {

  StateTreeImpl::StateTreeImpl() {
    // txBegin() is virtual and should not be used in the constructor
    tx_.emplace_back();
  }

  outcome::result<void> StateTreeImpl::set(const Address &address,
                                           const Actor &actor) {
    tx_.back().actors[address] = actor;
    return outcome::success();
  }

  outcome::result<boost::optional<Actor>> StateTreeImpl::tryGet(
      const Address &address) const {
    for (auto it{tx_.rbegin()}; it != tx_.rend(); ++it) {
      const auto actor{it->actors.find(address)};
      if (actor != it->actors.end()) {
        return actor->second;
      }
    }
    return boost::none;
  }

  void StateTreeImpl::txBegin() {
    tx_.emplace_back();
  }

  void StateTreeImpl::txRevert() {
    tx_.back() = {};
  }

  void StateTreeImpl::txEnd() {
    if (tx_.size() < 2) {
      return;
    }
    auto top{std::move(tx_.back())};
    tx_.pop_back();
    for (auto &[address, actor] : top.actors) {
      tx_.back().actors[address] = std::move(actor);
    }
  }

  size_t StateTreeImpl::depth() const {
    return tx_.size() - 1;
  }
}  // namespace xr::vm::state
