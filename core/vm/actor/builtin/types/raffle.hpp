/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace xr::vm::actor::builtin::types {
  /// Kind of prize locked on the prize chain
  enum class RaffleType : uint8_t {
    kNone = 0,
    kNft = 1,
    kEth = 2,
    kToken = 3,
  };

  /// Prize record status, kNone while the prize is locked
  enum class RafflePrizeStatus : uint8_t {
    kNone = 0,
    kClaimed = 1,
    kCanceled = 2,
  };

  /**
   * Raffle status on the ticket chain. Values only move forward, except
   * kCanceled which is reachable from kPrizeLocked and kIdle.
   */
  enum class RaffleStatus : uint8_t {
    kNone = 0,
    kPrizeLocked,
    kIdle,
    kRequested,
    kFulfilled,
    kPropagated,
    kCanceled,
  };

  /// Role id, granted per address
  enum class Role : uint8_t {
    kAdmin = 0,
    kApi = 1,
  };
}  // namespace xr::vm::actor::builtin::types
