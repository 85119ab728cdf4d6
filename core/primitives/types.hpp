/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/big_int.hpp"

namespace xr::primitives {
  /// Raffle id shared verbatim by both ledgers
  using RaffleId = UInt256;
  /// Randomness request id issued by the coordinator
  using RequestId = UInt256;
  /// Amount of wei or of the smallest unit of a fungible token
  using TokenAmount = UInt256;
  /// NFT id inside its collection
  using TokenId = UInt256;
  /// CCIP chain selector
  using ChainSelector = uint64_t;
  /// Unix time in seconds
  using Timestamp = uint64_t;
  using BlockNumber = uint64_t;
  /// Number of tickets in a single purchase
  using TicketCount = uint16_t;
  /// Number of tickets issued for a raffle
  using TicketSupply = uint64_t;
}  // namespace xr::primitives
