/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/states/vrf_coordinator_actor_state.hpp"

namespace xr::vm::actor::builtin::vrf_coordinator {
  using primitives::RequestId;
  using primitives::address::Address;

  struct Construct : ActorMethodBase<1> {
    ACTOR_METHOD_DECL();
  };

  /// Request one random word, the caller is called back on fulfillment
  struct RequestRandomWords : ActorMethodBase<2> {
    using Result = RequestId;
    ACTOR_METHOD_DECL();
  };

  /**
   * Remove a pending request before its fulfillment, oracle only
   * @return consumer to call back
   */
  struct TakeRequest : ActorMethodBase<3> {
    struct Params {
      RequestId request_id;
    };
    using Result = Address;
    ACTOR_METHOD_DECL();
  };
}  // namespace xr::vm::actor::builtin::vrf_coordinator
