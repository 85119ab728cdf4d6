/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/shared/roles.hpp"

namespace xr::vm::actor::builtin::shared {
  bool Roles::hasRole(const Address &user, Role role) const {
    const auto it = granted.find(user);
    return it != granted.end() && it->second.count(role) != 0;
  }

  void Roles::setRole(const Address &user, Role role, bool status) {
    if (status) {
      granted[user].insert(role);
      return;
    }
    const auto it = granted.find(user);
    if (it == granted.end()) {
      return;
    }
    it->second.erase(role);
    if (it->second.empty()) {
      granted.erase(it);
    }
  }

  outcome::result<void> requireRole(const Runtime &runtime,
                                    const Roles &roles,
                                    Role role) {
    if (!roles.hasRole(runtime.getImmediateCaller(), role)) {
      ABORT(VMExitCode::kMissingRole);
    }
    return outcome::success();
  }
}  // namespace xr::vm::actor::builtin::shared
