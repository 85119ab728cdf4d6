/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/types.hpp"

namespace xr::vm::actor::builtin::types::ticket_manager {
  using primitives::Timestamp;

  /// Shortest time a raffle stays open, seconds
  constexpr Timestamp kMinRaffleDuration{60};
}  // namespace xr::vm::actor::builtin::types::ticket_manager
