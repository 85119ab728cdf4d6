/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"

namespace xr::codec::ccip {
  using primitives::RaffleId;
  using primitives::address::Address;

  enum class CcipMessageError {
    kUnknownMessageType = 1,
    kInvalidLength,
  };

  /// Leading byte of messages sent from the ticket chain to the prize chain
  enum class MessageType : uint8_t {
    kRaffleCanceled = 0,
    kWinnerDrawn = 1,
  };

  /// Ticket chain -> prize chain: release the prize to its owner
  struct RaffleCanceled {
    RaffleId raffle_id;
  };
  inline bool operator==(const RaffleCanceled &lhs, const RaffleCanceled &rhs) {
    return lhs.raffle_id == rhs.raffle_id;
  }

  /// Ticket chain -> prize chain: record the winner of a raffle
  struct WinnerDrawn {
    RaffleId raffle_id;
    Address winner;
  };
  inline bool operator==(const WinnerDrawn &lhs, const WinnerDrawn &rhs) {
    return lhs.raffle_id == rhs.raffle_id && lhs.winner == rhs.winner;
  }

  /// Prize chain -> ticket chain: a prize is locked for the raffle
  struct PrizeLocked {
    RaffleId raffle_id;
  };
  inline bool operator==(const PrizeLocked &lhs, const PrizeLocked &rhs) {
    return lhs.raffle_id == rhs.raffle_id;
  }

  /// Any message the prize chain may receive
  using PrizeChainMessage = std::variant<RaffleCanceled, WinnerDrawn>;

  constexpr size_t kRaffleCanceledSize{33};
  constexpr size_t kWinnerDrawnSize{53};
  constexpr size_t kPrizeLockedSize{32};

  Bytes encode(const RaffleCanceled &message);
  Bytes encode(const WinnerDrawn &message);
  Bytes encode(const PrizeLocked &message);
  Bytes encode(const PrizeChainMessage &message);

  /**
   * Decode message received by the prize chain, dispatching on the leading
   * message type byte
   * @return kUnknownMessageType for a leading byte that is not a MessageType
   */
  outcome::result<PrizeChainMessage> decodePrizeChainMessage(BytesIn data);

  /// Decode message received by the ticket chain, raw raffle id only
  outcome::result<PrizeLocked> decodePrizeLocked(BytesIn data);
}  // namespace xr::codec::ccip

OUTCOME_HPP_DECLARE_ERROR(xr::codec::ccip, CcipMessageError);
