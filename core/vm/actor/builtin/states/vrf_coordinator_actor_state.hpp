/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "vm/actor/actor.hpp"

namespace xr::vm::actor::builtin::states {
  using primitives::RequestId;
  using primitives::address::Address;

  /// Randomness oracle, requests wait here until fulfilled
  struct VrfCoordinatorActorState : ActorState {
    /// Allowed to fulfill requests
    Address oracle;
    RequestId next_request_id{1};
    /// Consumer of each unfulfilled request
    std::map<RequestId, Address> pending;
  };
}  // namespace xr::vm::actor::builtin::states
