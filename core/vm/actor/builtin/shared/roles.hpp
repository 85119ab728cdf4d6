/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/types/raffle.hpp"

namespace xr::vm::actor::builtin::shared {
  using primitives::address::Address;
  using types::Role;

  /// Roles granted per address
  struct Roles {
    bool hasRole(const Address &user, Role role) const;

    void setRole(const Address &user, Role role, bool status);

    std::map<Address, std::set<Role>> granted;
  };

  /// Aborts with kMissingRole unless the immediate caller has the role
  outcome::result<void> requireRole(const Runtime &runtime,
                                    const Roles &roles,
                                    Role role);

  /**
   * Grant or revoke a role, admin only
   * @tparam State - actor state with roles
   */
  template <typename State, uint64_t number>
  struct SetRole : ActorMethodBase<number> {
    struct Params {
      Address user;
      Role role;
      bool status;
    };
    using Result = None;

    static outcome::result<Result> call(Runtime &runtime,
                                        const Params &params) {
      OUTCOME_TRY(state, runtime.getActorState<State>());
      OUTCOME_TRY(requireRole(runtime, state.roles, Role::kAdmin));
      state.roles.setRole(params.user, params.role, params.status);
      OUTCOME_TRY(runtime.commitState(state));
      runtime.emitEvent(
          types::RoleUpdated{params.user, params.role, params.status});
      return None{};
    }
  };

  /// Check whether user has a role
  template <typename State, uint64_t number>
  struct HasRole : ActorMethodBase<number> {
    struct Params {
      Address user;
      Role role;
    };
    using Result = bool;

    static outcome::result<Result> call(Runtime &runtime,
                                        const Params &params) {
      OUTCOME_TRY(state, runtime.getActorState<State>());
      return state.roles.hasRole(params.user, params.role);
    }
  };
}  // namespace xr::vm::actor::builtin::shared
