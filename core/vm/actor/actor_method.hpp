/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "vm/actor/actor.hpp"
#include "vm/exit_code/exit_code.hpp"
#include "vm/runtime/runtime.hpp"

/// Declare actor method function
#define ACTOR_METHOD_DECL() \
  static outcome::result<Result> call(Runtime &, const Params &);

/// Define actor method function
#define ACTOR_METHOD_IMPL(M) \
  outcome::result<M::Result> M::call(Runtime &runtime, const Params &params)

namespace xr::vm::actor {
  using runtime::Runtime;

  /// Empty params or result
  struct None {};

  using MethodNumber = uint64_t;

  /// Actor method base class
  template <uint64_t number>
  struct ActorMethodBase {
    using Params = None;
    using Result = None;
    static constexpr MethodNumber Number{number};
  };
}  // namespace xr::vm::actor
