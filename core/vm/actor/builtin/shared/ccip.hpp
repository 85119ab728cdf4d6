/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <set>
#include <tuple>

#include "vm/actor/builtin/shared/roles.hpp"

namespace xr::vm::actor::builtin::shared {
  using common::Hash256;
  using primitives::ChainSelector;
  using runtime::Any2EvmMessage;

  /// Contract on a remote chain allowed to exchange messages with us
  struct CcipCounterpart {
    Address contract;
    ChainSelector chain{};
  };

  inline bool operator<(const CcipCounterpart &lhs,
                        const CcipCounterpart &rhs) {
    return std::tie(lhs.chain, lhs.contract)
           < std::tie(rhs.chain, rhs.contract);
  }

  inline bool operator==(const CcipCounterpart &lhs,
                         const CcipCounterpart &rhs) {
    return lhs.chain == rhs.chain && lhs.contract == rhs.contract;
  }
  XR_OPERATOR_NOT_EQUAL(CcipCounterpart)

  /// Cross-chain plumbing shared by both managers
  struct CcipConfig {
    bool isCounterpart(const CcipCounterpart &counterpart) const;

    void setCounterpart(const CcipCounterpart &counterpart, bool enabled);

    /// Router allowed to deliver messages, receives fees
    Address router;
    /// Token fees are paid in
    Address link_token;
    std::set<CcipCounterpart> counterparts;
    /// Attached to every outbound message
    Bytes extra_args;
  };

  /**
   * Authenticate an inbound message. The immediate caller must be the router
   * (kInvalidRouter), then the sender must be an enabled counterpart
   * (kUnauthorizedCCIPSender).
   */
  outcome::result<void> validateCcipReceive(const Runtime &runtime,
                                            const CcipConfig &config,
                                            const Any2EvmMessage &message);

  /**
   * Pay the router fee in LINK and send the message to a counterpart
   * @return id of the sent message
   */
  outcome::result<Hash256> sendCcipMessage(Runtime &runtime,
                                           const CcipConfig &config,
                                           const CcipCounterpart &destination,
                                           Bytes data);

  /// Enable or disable a counterpart, admin only
  template <typename State, uint64_t number>
  struct SetCCIPCounterpart : ActorMethodBase<number> {
    struct Params {
      Address contract;
      ChainSelector chain;
      bool enabled;
    };
    using Result = None;

    static outcome::result<Result> call(Runtime &runtime,
                                        const Params &params) {
      OUTCOME_TRY(state, runtime.getActorState<State>());
      OUTCOME_TRY(requireRole(runtime, state.roles, Role::kAdmin));
      state.ccip.setCounterpart({params.contract, params.chain},
                                params.enabled);
      OUTCOME_TRY(runtime.commitState(state));
      return None{};
    }
  };

  /// Set extra args attached to outbound messages, admin only
  template <typename State, uint64_t number>
  struct SetCCIPExtraArgs : ActorMethodBase<number> {
    struct Params {
      Bytes extra_args;
    };
    using Result = None;

    static outcome::result<Result> call(Runtime &runtime,
                                        const Params &params) {
      OUTCOME_TRY(state, runtime.getActorState<State>());
      OUTCOME_TRY(requireRole(runtime, state.roles, Role::kAdmin));
      state.ccip.extra_args = params.extra_args;
      OUTCOME_TRY(runtime.commitState(state));
      return None{};
    }
  };
}  // namespace xr::vm::actor::builtin::shared
